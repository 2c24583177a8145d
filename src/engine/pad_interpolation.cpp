#include "engine/pad_interpolation.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace VoiceShaper {

namespace {

[[nodiscard]] bool isUnitSlider(float v) noexcept {
    return std::isfinite(v) && v >= -1.0f && v <= 1.0f;
}

[[nodiscard]] constexpr float lerp(float a, float b, float t) noexcept {
    return a * (1.0f - t) + b * t;
}

} // namespace

Result<FormantVector> PadInterpolator::compute(const BasePreset& base,
                                               PadPoint pad,
                                               const VoiceProfile& profile,
                                               float brightness,
                                               float resonance) const {
    if (!pad.isInDomain()) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "pad (%g, %g) outside [-1,1]x[-1,1]",
                      static_cast<double>(pad.x), static_cast<double>(pad.y));
        return Result<FormantVector>::failure(ErrorCode::InvalidPad, buffer);
    }
    if (!isUnitSlider(brightness) || !isUnitSlider(resonance)) {
        return Result<FormantVector>::failure(ErrorCode::InvalidSlider,
                                              "brightness/resonance must lie in [-1,1]");
    }
    if (!base.has_value()) {
        return Result<FormantVector>::failure(ErrorCode::MissingBase,
                                              "no base preset captured");
    }

    const float wy = std::clamp(std::fabs(pad.y), 0.0f, 1.0f);
    const float frequencyScale = (1.0f + config_.brightnessShift * pad.x)
                               * (1.0f + config_.brightnessSliderShift * brightness);
    const float levelScale = 1.0f - config_.resonanceLevelCut * std::max(0.0f, resonance);
    const float resonanceScale = 1.0f - config_.resonanceQScale * resonance;

    const FormantVector& from = *base;
    const FormantVector& to = profile.canonical;

    FormantVector::Bank frequencies{};
    FormantVector::Bank levels{};
    FormantVector::Bank resonances{};

    for (size_t i = 0; i < kNumFormants; ++i) {
        frequencies[i] = lerp(from.frequency(i), to.frequency(i), wy) * frequencyScale;
        levels[i] = std::clamp(lerp(from.level(i), to.level(i), wy) * levelScale,
                               0.0f, config_.levelMax);
        resonances[i] = std::clamp(lerp(from.resonance(i), to.resonance(i), wy) * resonanceScale,
                                   config_.resonanceMin, config_.resonanceMax);
    }

    return Result<FormantVector>::success(FormantVector(frequencies, levels, resonances));
}

} // namespace VoiceShaper
