// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Level and Ratio Conversions
// ==============================================================================
// No allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <bit>
#include <cstddef>
#include <cmath>
#include <cstdint>

namespace VoiceShaper::DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Floor value for silence/zero gain in decibels.
/// Represents approximately 24-bit dynamic range (6.02 dB/bit * 24 = ~144 dB).
constexpr float kSilenceFloorDb = -144.0f;

namespace detail {

/// Constexpr-safe NaN check using the IEEE 754 bit pattern.
/// Exponent all ones and a non-zero mantissa.
constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

} // namespace detail

// ==============================================================================
// Functions
// ==============================================================================

/// Convert linear amplitude to decibels.
///
/// @param gain  Linear amplitude
/// @return      20*log10(gain), floored at kSilenceFloorDb
///
/// @note        Zero/negative/NaN input returns kSilenceFloorDb
///
/// @example     gainToDb(1.0f)  -> 0.0f
/// @example     gainToDb(0.5f)  -> ~-6.02f
[[nodiscard]] inline float gainToDb(float gain) noexcept {
    if (detail::isNaN(gain) || gain <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 20.0f * std::log10(gain);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

/// Convert a power (energy) ratio to decibels: 10*log10(ratio).
///
/// Unlike gainToDb there is no floor on the positive side, and the negative
/// side is floored at kSilenceFloorDb. Callers wanting a symmetric compressed
/// value clamp the result themselves.
[[nodiscard]] inline float powerRatioToDb(float ratio) noexcept {
    if (detail::isNaN(ratio) || ratio <= 0.0f) {
        return kSilenceFloorDb;
    }
    const float result = 10.0f * std::log10(ratio);
    return (result < kSilenceFloorDb) ? kSilenceFloorDb : result;
}

/// RMS of a sample block, in dBFS (full scale = 1.0).
[[nodiscard]] inline float rmsDb(const float* samples, size_t count) noexcept {
    if (samples == nullptr || count == 0) return kSilenceFloorDb;
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    return gainToDb(static_cast<float>(std::sqrt(sum / static_cast<double>(count))));
}

} // namespace VoiceShaper::DSP
