// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Analysis window generators for frame-based spectral measurement.
// Periodic (DFT-even) variant, suited to 50% overlapped analysis frames.
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <numbers>
#include <vector>

namespace VoiceShaper::DSP {

namespace Window {

/// @brief Fill buffer with Hann window (periodic variant)
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N)
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    constexpr float kTwoPi = 2.0f * std::numbers::pi_v<float>;
    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.5f - 0.5f * std::cos(phase);
    }
}

/// @brief Generate Hann coefficients (allocates vector)
[[nodiscard]] inline std::vector<float> hann(size_t size) {
    std::vector<float> window(size, 0.0f);
    generateHann(window.data(), size);
    return window;
}

} // namespace Window

} // namespace VoiceShaper::DSP
