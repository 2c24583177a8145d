#pragma once

// ==============================================================================
// PadInterpolator - Pad Position to Formant Vector
// ==============================================================================
// Blends the captured base preset toward a voice profile's canonical vector
// and applies brightness/resonance shaping. Pure and deterministic: identical
// inputs give a bit-identical vector.
//
// For every formant index i, with wy = clamp(|y|, 0, 1):
//   Fi = lerp(base.Fi, profile.Fi, wy) * (1 + kBright*x) * (1 + kBrightSlider*brightness)
//   Li = clamp(lerp(base.Li, profile.Li, wy) * (1 - kRes*max(0, resonance)), 0, LMAX)
//   Ri = clamp(lerp(base.Ri, profile.Ri, wy) * (1 - kResQ*resonance), RMIN, RMAX)
//
// Slider convention: brightness > 0 brightens; resonance > 0 asks for less
// resonance (level cut and lower Q), resonance < 0 raises Q.
// Out-of-range results are clamped, never rejected.
// ==============================================================================

#include "config/engine_config.h"
#include "model/errors.h"
#include "model/formant_vector.h"
#include "model/pad_point.h"
#include "model/voice_profile.h"

#include <optional>

namespace VoiceShaper {

/// Captured base preset; nullopt until the first capture
using BasePreset = std::optional<FormantVector>;

class PadInterpolator {
public:
    explicit PadInterpolator(MappingConfig config = {}) noexcept
        : config_(config)
    {
    }

    /// @brief Compute the processed vector
    /// @param base Captured base preset
    /// @param pad Pad position, must lie in [-1,1]^2
    /// @param profile Voice profile to morph toward
    /// @param brightness Brightness slider in [-1,1]
    /// @param resonance Resonance slider in [-1,1]
    /// @return InvalidPad, InvalidSlider or MissingBase on bad input
    [[nodiscard]] Result<FormantVector> compute(const BasePreset& base,
                                                PadPoint pad,
                                                const VoiceProfile& profile,
                                                float brightness,
                                                float resonance) const;

    [[nodiscard]] const MappingConfig& config() const noexcept { return config_; }

private:
    MappingConfig config_;
};

} // namespace VoiceShaper
