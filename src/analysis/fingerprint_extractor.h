#pragma once

// ==============================================================================
// FingerprintExtractor - Coarse Spectral Fingerprint of a Voice Clip
// ==============================================================================
// Reduces a mono recording to one point on the voice pad:
//   x: spectral centroid of the long-term spectrum, mapped linearly from the
//      reference band [centroidLowHz, centroidHighHz] onto [-1,1]
//   y: chest/head balance, 10*log10(E[chest band] / E[head band]), mapped as
//      (balanceCenterDb - balanceDb) / balanceSpanDb; more high-band energy
//      moves toward head (+1)
//
// This is a centroid + band-ratio fingerprint, not formant detection.
//
// Hard preconditions fail (UnsupportedFormat, EmptySignal). Silent, clipped
// or non-finite input still yields a fingerprint, flagged low confidence.
// ==============================================================================

#include "config/engine_config.h"
#include "dsp/core/db_utils.h"
#include "model/errors.h"
#include "model/pad_point.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>

namespace VoiceShaper {

struct WavData;

/// Reasons a fingerprint is low confidence (bit flags)
enum FingerprintFlag : uint8_t {
    kFingerprintSilent       = 1 << 0,  ///< RMS below the silence threshold
    kFingerprintClipped      = 1 << 1,  ///< Too many full-scale samples
    kFingerprintNonFinite    = 1 << 2,  ///< NaN/Inf samples replaced by zero
    kFingerprintNoBandEnergy = 1 << 3   ///< Nothing in the chest and head bands
};

struct Fingerprint {
    PadPoint point;                          ///< Candidate pad position
    float centroidHz = 0.0f;
    float balanceDb = 0.0f;                  ///< Chest/head energy ratio
    float rmsDb = DSP::kSilenceFloorDb;
    float durationMs = 0.0f;
    int sampleRate = 0;
    size_t fftSize = 0;
    size_t frameCount = 0;
    uint8_t flags = 0;

    [[nodiscard]] bool isLowConfidence() const noexcept { return flags != 0; }
    [[nodiscard]] bool hasFlag(FingerprintFlag flag) const noexcept { return (flags & flag) != 0; }
};

class FingerprintExtractor {
public:
    explicit FingerprintExtractor(FingerprintConfig config = {}) noexcept
        : config_(config)
    {
    }

    /// @brief Fingerprint raw mono samples
    /// @param samples Mono samples, full scale = 1.0
    /// @param sampleRate Samples per second, > 0
    /// @param stop Cancels the analysis between frames (Result: Cancelled)
    [[nodiscard]] Result<Fingerprint> analyze(std::span<const float> samples,
                                              int sampleRate,
                                              std::stop_token stop = {}) const;

    /// @brief Fingerprint a decoded WAV file; must be mono PCM
    [[nodiscard]] Result<Fingerprint> analyze(const WavData& wav, std::stop_token stop = {}) const;

    /// Frame length used at a sample rate
    [[nodiscard]] size_t frameSizeFor(int sampleRate) const noexcept;

    /// Centroid (Hz) to pad x, clamped to [-1,1]
    [[nodiscard]] float centroidToPadX(float centroidHz) const noexcept;

    /// Chest/head balance (dB) to pad y, clamped to [-1,1]
    [[nodiscard]] float balanceToPadY(float balanceDb) const noexcept;

    [[nodiscard]] const FingerprintConfig& config() const noexcept { return config_; }

private:
    FingerprintConfig config_;
};

} // namespace VoiceShaper
