// ==============================================================================
// IO Tests - WAV Reader
// ==============================================================================
// Tests for: src/io/wav_reader.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "io/wav_reader.h"
#include "test_helpers/wav_builder.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace VoiceShaper;
using TestHelpers::WavBuilder;
using Catch::Approx;

// ==============================================================================
// Integer PCM Widths
// ==============================================================================

TEST_CASE("Integer PCM decodes at every supported width", "[wav]") {
    const uint16_t bits = GENERATE(8, 16, 24, 32);
    INFO(bits << "-bit");

    const auto image = WavBuilder()
                           .format(kWaveFormatPcm, 1, 22050, bits)
                           .samples({0.0f, 0.5f, -0.5f, 0.25f})
                           .build();

    const auto result = parseWav(image);
    REQUIRE(result);

    const WavData& wav = result.value;
    REQUIRE(wav.sampleRate == 22050);
    REQUIRE(wav.channels == 1);
    REQUIRE(wav.bitsPerSample == bits);
    REQUIRE(wav.isMonoPcm());
    REQUIRE(wav.samples.size() == 4);

    const float tolerance = (bits == 8) ? 1.0f / 64.0f : 1e-4f;
    REQUIRE(wav.samples[0] == Approx(0.0f).margin(tolerance));
    REQUIRE(wav.samples[1] == Approx(0.5f).margin(tolerance));
    REQUIRE(wav.samples[2] == Approx(-0.5f).margin(tolerance));
    REQUIRE(wav.samples[3] == Approx(0.25f).margin(tolerance));
}

TEST_CASE("16-bit full scale maps into [-1, 1)", "[wav]") {
    const auto image = WavBuilder()
                           .format(kWaveFormatPcm, 1, 44100, 16)
                           .rawData({0x00, 0x80, 0xFF, 0x7F})  // -32768, 32767
                           .build();

    const auto result = parseWav(image);
    REQUIRE(result);
    REQUIRE(result.value.samples[0] == -1.0f);
    REQUIRE(result.value.samples[1] == Approx(32767.0f / 32768.0f));
}

TEST_CASE("Extensible header with a PCM sub-format is accepted", "[wav]") {
    const auto image = WavBuilder()
                           .format(kWaveFormatPcm, 1, 48000, 24)
                           .extensible(kWaveFormatPcm)
                           .samples({0.5f, -0.5f})
                           .build();

    const auto result = parseWav(image);
    REQUIRE(result);
    REQUIRE(result.value.formatTag == kWaveFormatPcm);
    REQUIRE(result.value.samples.size() == 2);
    REQUIRE(result.value.samples[0] == Approx(0.5f).margin(1e-5f));
}

TEST_CASE("Multi-channel data stays interleaved", "[wav]") {
    const auto image = WavBuilder()
                           .format(kWaveFormatPcm, 2, 44100, 16)
                           .samples({0.5f, -0.5f, 0.25f, -0.25f, 0.0f, 0.0f})
                           .build();

    const auto result = parseWav(image);
    REQUIRE(result);
    REQUIRE(result.value.channels == 2);
    REQUIRE(result.value.frameCount() == 3);
    REQUIRE(result.value.samples[1] == Approx(-0.5f).margin(1e-4f));
    REQUIRE_FALSE(result.value.isMonoPcm());
}

TEST_CASE("Unknown chunks are skipped, odd sizes padded", "[wav]") {
    const auto image = WavBuilder()
                           .format(kWaveFormatPcm, 1, 44100, 16)
                           .extraChunk("LIST", {1, 2, 3})
                           .samples({0.5f})
                           .build();

    const auto result = parseWav(image);
    REQUIRE(result);
    REQUIRE(result.value.samples.size() == 1);
    REQUIRE(result.value.samples[0] == Approx(0.5f).margin(1e-4f));
}

// ==============================================================================
// Rejections
// ==============================================================================

TEST_CASE("Non-PCM formats are unsupported", "[wav]") {
    SECTION("IEEE float") {
        const auto image = WavBuilder().format(3, 1, 44100, 32).rawData({0, 0, 0, 0}).build();
        REQUIRE(parseWav(image).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("extensible with a float sub-format") {
        const auto image = WavBuilder().format(1, 1, 44100, 32).extensible(3).rawData({0, 0, 0, 0}).build();
        REQUIRE(parseWav(image).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("12-bit samples") {
        const auto image = WavBuilder().format(kWaveFormatPcm, 1, 44100, 12).rawData({0, 0}).build();
        REQUIRE(parseWav(image).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("zero channels") {
        const auto image = WavBuilder().format(kWaveFormatPcm, 0, 44100, 16).build();
        REQUIRE(parseWav(image).error == ErrorCode::UnsupportedFormat);
    }
}

TEST_CASE("Structural faults", "[wav]") {
    SECTION("not a RIFF image") {
        const std::vector<uint8_t> junk = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 'W', 'A', 'V', 'E'};
        REQUIRE(parseWav(junk).error == ErrorCode::UnsupportedFormat);
        REQUIRE(parseWav(std::vector<uint8_t>{}).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("missing fmt chunk") {
        const auto image = WavBuilder().omitFormat().samples({0.1f}).build();
        REQUIRE(parseWav(image).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("missing data chunk") {
        const auto image = WavBuilder().omitData().build();
        REQUIRE(parseWav(image).error == ErrorCode::IoError);
    }

    SECTION("truncated data chunk") {
        const auto image = WavBuilder().samples({0.1f, 0.2f, 0.3f, 0.4f}).truncateBy(3).build();
        const auto result = parseWav(image);
        REQUIRE(result.error == ErrorCode::IoError);
        REQUIRE(result.message.find("truncated") != std::string::npos);
    }
}

// ==============================================================================
// Files
// ==============================================================================

TEST_CASE("readWavFile reads from disk", "[wav]") {
    const auto path = std::filesystem::temp_directory_path() / "voiceshaper_wav_reader_test.wav";
    const auto image = WavBuilder().format(kWaveFormatPcm, 1, 16000, 16).samples({0.5f, -0.5f}).build();
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(image.data()), static_cast<std::streamsize>(image.size()));
    }

    const auto result = readWavFile(path);
    std::filesystem::remove(path);

    REQUIRE(result);
    REQUIRE(result.value.sampleRate == 16000);
    REQUIRE(result.value.samples.size() == 2);

    SECTION("missing file is an IoError") {
        REQUIRE(readWavFile(path).error == ErrorCode::IoError);
    }
}
