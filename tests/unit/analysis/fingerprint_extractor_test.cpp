// ==============================================================================
// Analysis Tests - Spectral Fingerprint
// ==============================================================================
// Tests for: src/analysis/fingerprint_extractor.h
//
// Expected pad positions follow from the default FingerprintConfig:
//   x = 2 * (centroid - 1500) / 2500 - 1
//   y = (10 dB - balanceDb) / 20 dB
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "analysis/fingerprint_extractor.h"
#include "io/wav_reader.h"
#include "test_helpers/test_signals.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stop_token>
#include <vector>

using namespace VoiceShaper;
using namespace TestHelpers;
using Catch::Approx;

namespace {

constexpr size_t kOneSecond = 44100;

Result<Fingerprint> fingerprintOf(const std::vector<float>& samples, int sampleRate = kTestSampleRate) {
    const FingerprintExtractor extractor;
    return extractor.analyze(samples, sampleRate);
}

} // namespace

// ==============================================================================
// Preconditions
// ==============================================================================

TEST_CASE("Clips shorter than the minimum duration fail with EmptySignal", "[fingerprint]") {
    const auto result = fingerprintOf(makeSine(440.0f, samplesFor(40.0)));
    REQUIRE_FALSE(result);
    REQUIRE(result.error == ErrorCode::EmptySignal);

    SECTION("an empty clip") {
        REQUIRE(fingerprintOf({}).error == ErrorCode::EmptySignal);
    }

    SECTION("exactly the minimum is accepted") {
        REQUIRE(fingerprintOf(makeSine(440.0f, samplesFor(50.0))));
    }
}

TEST_CASE("Unusable sample rates fail with UnsupportedFormat", "[fingerprint]") {
    const auto samples = makeSine(440.0f, kOneSecond);
    REQUIRE(fingerprintOf(samples, 0).error == ErrorCode::UnsupportedFormat);
    REQUIRE(fingerprintOf(samples, -44100).error == ErrorCode::UnsupportedFormat);
}

TEST_CASE("Only mono PCM WAV data is analysed", "[fingerprint]") {
    const FingerprintExtractor extractor;

    WavData wav;
    wav.sampleRate = kTestSampleRate;
    wav.bitsPerSample = 16;
    wav.formatTag = kWaveFormatPcm;

    SECTION("stereo") {
        wav.channels = 2;
        wav.samples = makeSine(440.0f, 2 * kOneSecond);
        const auto result = extractor.analyze(wav);
        REQUIRE(result.error == ErrorCode::UnsupportedFormat);
    }

    SECTION("float format") {
        wav.channels = 1;
        wav.formatTag = 3;
        wav.samples = makeSine(440.0f, kOneSecond);
        REQUIRE(extractor.analyze(wav).error == ErrorCode::UnsupportedFormat);
    }

    SECTION("mono PCM") {
        wav.channels = 1;
        wav.samples = makeSine(440.0f, kOneSecond);
        REQUIRE(extractor.analyze(wav));
    }
}

// ==============================================================================
// Brightness (pad x)
// ==============================================================================

TEST_CASE("Pure tones map to x by their place in the reference band", "[fingerprint]") {
    const auto [frequency, expectedX] = GENERATE(table<float, float>({
        {3000.0f, 0.2f},
        {2000.0f, -0.6f},
        {2750.0f, 0.0f},
        {300.0f, -1.0f},
        {6000.0f, 1.0f}
    }));
    INFO(frequency << " Hz");

    const auto result = fingerprintOf(makeSine(frequency, kOneSecond));
    REQUIRE(result);
    REQUIRE(result.value.point.x == Approx(expectedX).margin(0.02));
    REQUIRE_FALSE(result.value.isLowConfidence());
}

TEST_CASE("A 3 kHz tone is brighter than a 300 Hz tone", "[fingerprint]") {
    const auto high = fingerprintOf(makeSine(3000.0f, kOneSecond));
    const auto low = fingerprintOf(makeSine(300.0f, kOneSecond));
    REQUIRE(high);
    REQUIRE(low);
    REQUIRE(high.value.point.x > low.value.point.x);
    REQUIRE(high.value.centroidHz == Approx(3000.0f).margin(15.0f));
    REQUIRE(low.value.centroidHz == Approx(300.0f).margin(15.0f));
}

// ==============================================================================
// Chest/head balance (pad y)
// ==============================================================================

TEST_CASE("Chest/head balance maps to y", "[fingerprint]") {
    SECTION("energy only in the chest band is full chest") {
        const auto result = fingerprintOf(makeSine(300.0f, kOneSecond));
        REQUIRE(result);
        REQUIRE(result.value.balanceDb > 30.0f);
        REQUIRE(result.value.point.y == Approx(-1.0f));
    }

    SECTION("energy only in the head band is full head") {
        const auto result = fingerprintOf(makeSine(3000.0f, kOneSecond));
        REQUIRE(result);
        REQUIRE(result.value.balanceDb < -10.0f);
        REQUIRE(result.value.point.y == Approx(1.0f));
    }

    SECTION("equal energy sits at balance 0 dB, half way toward head") {
        const auto result = fingerprintOf(makeSines({400.0f, 3000.0f}, kOneSecond));
        REQUIRE(result);
        REQUIRE(result.value.balanceDb == Approx(0.0f).margin(0.5f));
        REQUIRE(result.value.point.y == Approx(0.5f).margin(0.03f));
    }
}

TEST_CASE("Normalisation helpers clamp to the pad", "[fingerprint]") {
    const FingerprintExtractor extractor;

    REQUIRE(extractor.centroidToPadX(1500.0f) == Approx(-1.0f));
    REQUIRE(extractor.centroidToPadX(4000.0f) == Approx(1.0f));
    REQUIRE(extractor.centroidToPadX(100.0f) == -1.0f);
    REQUIRE(extractor.centroidToPadX(9000.0f) == 1.0f);

    REQUIRE(extractor.balanceToPadY(10.0f) == Approx(0.0f));
    REQUIRE(extractor.balanceToPadY(-10.0f) == Approx(1.0f));
    REQUIRE(extractor.balanceToPadY(30.0f) == Approx(-1.0f));
    REQUIRE(extractor.balanceToPadY(-200.0f) == 1.0f);
}

TEST_CASE("Frame length follows the sample rate", "[fingerprint]") {
    const FingerprintExtractor extractor;

    REQUIRE(extractor.frameSizeFor(8000) == 2048);
    REQUIRE(extractor.frameSizeFor(22050) == 2048);
    REQUIRE(extractor.frameSizeFor(44100) == 4096);
    REQUIRE(extractor.frameSizeFor(48000) == 4096);
    REQUIRE(extractor.frameSizeFor(96000) == 4096);
}

// ==============================================================================
// Low Confidence
// ==============================================================================

TEST_CASE("Silence is flagged, not rejected", "[fingerprint]") {
    const auto result = fingerprintOf(std::vector<float>(samplesFor(100.0), 0.0f));
    REQUIRE(result);

    const Fingerprint& fp = result.value;
    REQUIRE(fp.isLowConfidence());
    REQUIRE(fp.hasFlag(kFingerprintSilent));
    REQUIRE(fp.hasFlag(kFingerprintNoBandEnergy));
    REQUIRE(fp.point == PadPoint{0.0f, 0.0f});
}

TEST_CASE("Very quiet audio is flagged silent", "[fingerprint]") {
    const auto result = fingerprintOf(makeSine(1000.0f, kOneSecond, kTestSampleRate, 0.0001f));
    REQUIRE(result);
    REQUIRE(result.value.hasFlag(kFingerprintSilent));
    REQUIRE(result.value.rmsDb < -60.0f);
}

TEST_CASE("Full-scale clipping is flagged", "[fingerprint]") {
    const auto result = fingerprintOf(makeSquare(220.0f, kOneSecond));
    REQUIRE(result);
    REQUIRE(result.value.hasFlag(kFingerprintClipped));
    REQUIRE_FALSE(result.value.hasFlag(kFingerprintSilent));
}

TEST_CASE("Non-finite samples are replaced and flagged", "[fingerprint]") {
    auto samples = makeSine(1000.0f, kOneSecond);
    samples[100] = std::numeric_limits<float>::quiet_NaN();
    samples[200] = std::numeric_limits<float>::infinity();

    const auto result = fingerprintOf(samples);
    REQUIRE(result);
    REQUIRE(result.value.hasFlag(kFingerprintNonFinite));
    REQUIRE(std::isfinite(result.value.point.x));
    REQUIRE(std::isfinite(result.value.point.y));
}

// ==============================================================================
// Metadata and Cancellation
// ==============================================================================

TEST_CASE("Fingerprint carries analysis metadata", "[fingerprint]") {
    const auto result = fingerprintOf(makeSine(1000.0f, kOneSecond));
    REQUIRE(result);

    const Fingerprint& fp = result.value;
    REQUIRE(fp.sampleRate == kTestSampleRate);
    REQUIRE(fp.durationMs == Approx(1000.0f));
    REQUIRE(fp.fftSize == 4096);
    REQUIRE(fp.frameCount == 21);  // 20 full frames plus a padded tail
    REQUIRE(fp.rmsDb == Approx(-9.03f).margin(0.05f));
}

TEST_CASE("A clip shorter than one frame is analysed as one padded frame", "[fingerprint]") {
    const auto result = fingerprintOf(makeSine(3000.0f, samplesFor(60.0)));
    REQUIRE(result);
    REQUIRE(result.value.frameCount == 1);
    REQUIRE(result.value.point.x == Approx(0.2f).margin(0.03));
}

TEST_CASE("Sound only in the clip tail is still fingerprinted", "[fingerprint]") {
    // 4096 samples of silence then a 1 kHz tone; the tone starts past the last full hop
    std::vector<float> samples(6143, 0.0f);
    const auto tone = makeSine(1000.0f, 2047, kTestSampleRate, 0.5f);
    std::copy(tone.begin(), tone.end(), samples.begin() + 4096);

    const auto result = fingerprintOf(samples);
    REQUIRE(result);

    const Fingerprint& fp = result.value;
    REQUIRE(fp.frameCount == 2);
    REQUIRE_FALSE(fp.hasFlag(kFingerprintSilent));
    REQUIRE_FALSE(fp.hasFlag(kFingerprintNoBandEnergy));
    REQUIRE(fp.centroidHz > 500.0f);
    REQUIRE(fp.centroidHz < 2500.0f);
    REQUIRE(fp.point.x < 0.0f);
}

TEST_CASE("A stopped analysis returns Cancelled", "[fingerprint]") {
    const FingerprintExtractor extractor;
    std::stop_source source;
    source.request_stop();

    const auto result = extractor.analyze(makeSine(1000.0f, kOneSecond), kTestSampleRate, source.get_token());
    REQUIRE_FALSE(result);
    REQUIRE(result.error == ErrorCode::Cancelled);
}

TEST_CASE("Fingerprinting is deterministic", "[fingerprint]") {
    const auto samples = makeWhiteNoise(kOneSecond);
    const auto a = fingerprintOf(samples);
    const auto b = fingerprintOf(samples);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a.value.point == b.value.point);
    REQUIRE(a.value.centroidHz == b.value.centroidHz);
}
