#include "config/config_overrides.h"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <system_error>
#include <utility>

namespace VoiceShaper {

namespace {

constexpr std::array<ConfigOverride, 14> kOverrides = {{
    {"--k-bright", "F scale per unit of pad x (0.15)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.brightnessShift = static_cast<float>(v); }},
    {"--k-bright-slider", "F scale per unit of brightness slider (0.10)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.brightnessSliderShift = static_cast<float>(v); }},
    {"--k-res", "level cut at resonance +1 (0.5)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.resonanceLevelCut = static_cast<float>(v); }},
    {"--k-res-q", "R scale per unit of resonance slider (0.3)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.resonanceQScale = static_cast<float>(v); }},
    {"--lmax", "highest formant level (63)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.levelMax = static_cast<float>(v); }},
    {"--rmin", "lowest formant resonance (3)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.resonanceMin = static_cast<float>(v); }},
    {"--rmax", "highest formant resonance (7)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.mapping.resonanceMax = static_cast<float>(v); }},
    {"--centroid-low", "centroid Hz mapped to pad x = -1 (1500)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.centroidLowHz = static_cast<float>(v); }},
    {"--centroid-high", "centroid Hz mapped to pad x = +1 (4000)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.centroidHighHz = static_cast<float>(v); }},
    {"--balance-center", "chest/head dB mapped to pad y = 0 (10)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.balanceCenterDb = static_cast<float>(v); }},
    {"--balance-span", "chest/head dB per unit of pad y (20)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.balanceSpanDb = static_cast<float>(v); }},
    {"--silence-db", "RMS dBFS below which a clip is silent (-60)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.silenceThresholdDb = static_cast<float>(v); }},
    {"--min-duration", "shortest analysable clip in ms (50)", OverrideKind::Real,
     [](EngineConfig& c, double v) { c.fingerprint.minDurationMs = static_cast<float>(v); }},
    {"--min-interval", "ms between dispatch starts (150)", OverrideKind::Milliseconds,
     [](EngineConfig& c, double v) { c.dispatch.minIntervalMs = static_cast<uint32_t>(v); }},
}};

Status invalid(std::string message) {
    return Status::failure(ErrorCode::InvalidConfig, std::move(message));
}

} // namespace

std::span<const ConfigOverride> configOverrides() noexcept {
    return kOverrides;
}

const ConfigOverride* findConfigOverride(std::string_view name) noexcept {
    for (const auto& entry : kOverrides) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

Status applyConfigOverride(EngineConfig& config, std::string_view name, std::string_view value) {
    const ConfigOverride* entry = findConfigOverride(name);
    if (entry == nullptr) {
        return invalid("unknown option " + std::string(name));
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();

    if (entry->kind == OverrideKind::Milliseconds) {
        uint32_t ms = 0;
        const auto [ptr, ec] = std::from_chars(first, last, ms);
        if (ec != std::errc() || ptr != last) {
            return invalid(std::string(name) + " expects a whole number of ms, got '" + std::string(value) + "'");
        }
        entry->apply(config, static_cast<double>(ms));
        return Status::ok();
    }

    double parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last || !std::isfinite(parsed)) {
        return invalid(std::string(name) + " expects a number, got '" + std::string(value) + "'");
    }
    entry->apply(config, parsed);
    return Status::ok();
}

Status applyConfigOverrides(EngineConfig& config,
                            const std::vector<std::pair<std::string, std::string>>& options) {
    EngineConfig candidate = config;
    for (const auto& [name, value] : options) {
        if (findConfigOverride(name) == nullptr) continue;
        if (Status status = applyConfigOverride(candidate, name, value); !status) {
            return status;
        }
    }

    if (Status status = validateConfig(candidate); !status) {
        return status;
    }
    config = candidate;
    return Status::ok();
}

Status validateConfig(const EngineConfig& config) {
    const MappingConfig& m = config.mapping;
    if (m.resonanceLevelCut < 0.0f || m.resonanceLevelCut > 1.0f) {
        return invalid("--k-res must be in [0, 1]");
    }
    if (m.levelMax <= 0.0f) {
        return invalid("--lmax must be positive");
    }
    if (m.resonanceMin < 0.0f || m.resonanceMin >= m.resonanceMax) {
        return invalid("--rmin must be non-negative and below --rmax");
    }
    // Brightness scales F by (1 + k) at the extremes; F must stay positive
    if (std::fabs(m.brightnessShift) >= 1.0f || std::fabs(m.brightnessSliderShift) >= 1.0f) {
        return invalid("--k-bright and --k-bright-slider must be in (-1, 1)");
    }
    if (std::fabs(m.resonanceQScale) >= 1.0f) {
        return invalid("--k-res-q must be in (-1, 1)");
    }

    const FingerprintConfig& f = config.fingerprint;
    if (f.centroidLowHz < 0.0f || f.centroidLowHz >= f.centroidHighHz) {
        return invalid("--centroid-low must be non-negative and below --centroid-high");
    }
    if (f.balanceSpanDb <= 0.0f) {
        return invalid("--balance-span must be positive");
    }
    if (f.minDurationMs <= 0.0f) {
        return invalid("--min-duration must be positive");
    }
    if (f.silenceThresholdDb > 0.0f) {
        return invalid("--silence-db must not be above 0 dBFS");
    }
    return Status::ok();
}

} // namespace VoiceShaper
