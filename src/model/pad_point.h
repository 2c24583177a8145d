#pragma once

// ==============================================================================
// PadPoint - Position on the Voice Pad
// ==============================================================================
// Domain is [-1,1] x [-1,1]:
//   x: -1 dark  ... +1 bright
//   y: -1 chest ... +1 head
// (0,0) is the neutral centre. Widgets working in [0,1] convert with
// fromNormalized()/toNormalized().
// ==============================================================================

#include <algorithm>
#include <cmath>

namespace VoiceShaper {

inline constexpr float kPadMin = -1.0f;
inline constexpr float kPadMax = 1.0f;

struct PadPoint {
    float x = 0.0f;  ///< Brightness, dark -> bright
    float y = 0.0f;  ///< Vocal colour, chest -> head

    /// Finite and inside the fixed domain
    [[nodiscard]] bool isInDomain() const noexcept {
        return std::isfinite(x) && std::isfinite(y)
            && x >= kPadMin && x <= kPadMax
            && y >= kPadMin && y <= kPadMax;
    }

    [[nodiscard]] static PadPoint fromNormalized(float xNorm, float yNorm) noexcept {
        return {2.0f * xNorm - 1.0f, 2.0f * yNorm - 1.0f};
    }

    /// Map to [0,1]^2, clamped, for widget drawing
    [[nodiscard]] PadPoint toNormalized() const noexcept {
        return {std::clamp(0.5f * (x + 1.0f), 0.0f, 1.0f),
                std::clamp(0.5f * (y + 1.0f), 0.0f, 1.0f)};
    }

    [[nodiscard]] bool operator==(const PadPoint& other) const noexcept = default;
};

} // namespace VoiceShaper
