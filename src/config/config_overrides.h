#pragma once

// ==============================================================================
// Config Overrides - Named Tunables
// ==============================================================================
// Maps "--name value" options onto EngineConfig fields so the mapping,
// fingerprint and dispatch constants can be calibrated without a rebuild.
//
// applyConfigOverrides() works on a copy and commits only when every
// recognised option parsed and the result passes validateConfig(). Options
// it does not know are left for the caller.
// ==============================================================================

#include "config/engine_config.h"
#include "model/errors.h"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace VoiceShaper {

enum class OverrideKind : uint8_t {
    Real,          ///< Any finite number
    Milliseconds   ///< Non-negative whole number
};

struct ConfigOverride {
    std::string_view name;   ///< Option name including the leading "--"
    std::string_view help;
    OverrideKind kind = OverrideKind::Real;
    void (*apply)(EngineConfig& config, double value) = nullptr;
};

/// All overridable tunables, in usage order
[[nodiscard]] std::span<const ConfigOverride> configOverrides() noexcept;

[[nodiscard]] const ConfigOverride* findConfigOverride(std::string_view name) noexcept;

/// Parse one value and store it; no cross-field checks
[[nodiscard]] Status applyConfigOverride(EngineConfig& config, std::string_view name, std::string_view value);

/// Apply every recognised option, then validate; config is untouched on failure
[[nodiscard]] Status applyConfigOverrides(EngineConfig& config,
                                          const std::vector<std::pair<std::string, std::string>>& options);

/// Cross-field consistency of a complete config
[[nodiscard]] Status validateConfig(const EngineConfig& config);

} // namespace VoiceShaper
