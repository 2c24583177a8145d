#pragma once

// ==============================================================================
// WAV Reader
// ==============================================================================
// Minimal RIFF/WAVE decoder for voice clips. Integer PCM only:
// 8-bit unsigned, 16/24/32-bit signed little endian, plain or
// WAVE_FORMAT_EXTENSIBLE with a PCM sub-format. Samples are converted to
// float in [-1, 1) and left interleaved.
// ==============================================================================

#include "model/errors.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace VoiceShaper {

inline constexpr uint16_t kWaveFormatPcm = 0x0001;
inline constexpr uint16_t kWaveFormatExtensible = 0xFFFE;

struct WavData {
    int sampleRate = 0;
    uint16_t channels = 0;
    uint16_t bitsPerSample = 0;
    uint16_t formatTag = 0;       ///< Effective format (sub-format for extensible files)
    std::vector<float> samples;   ///< Interleaved when channels > 1

    [[nodiscard]] size_t frameCount() const noexcept {
        return channels == 0 ? 0 : samples.size() / channels;
    }

    [[nodiscard]] bool isMonoPcm() const noexcept {
        return channels == 1 && formatTag == kWaveFormatPcm;
    }
};

/// Decode a WAV image held in memory
[[nodiscard]] Result<WavData> parseWav(std::span<const uint8_t> bytes);

/// Read and decode a WAV file
[[nodiscard]] Result<WavData> readWavFile(const std::filesystem::path& path);

} // namespace VoiceShaper
