#pragma once

// ==============================================================================
// Dispatch Planning
// ==============================================================================
// Turns a target FormantVector into the ordered list of parameter commands
// for one dispatch. Commands always follow kDispatchOrder and carry values
// already clamped into the sink's accepted range.
// ==============================================================================

#include "io/command_sink.h"
#include "model/errors.h"
#include "model/formant_vector.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace VoiceShaper {

enum class DispatchMode : uint8_t {
    Diff,  ///< Only fields that differ from the last dispatched vector
    Full   ///< All twelve fields
};

[[nodiscard]] constexpr const char* dispatchModeName(DispatchMode mode) noexcept {
    return mode == DispatchMode::Full ? "full" : "diff";
}

/// @brief Commands for one dispatch
/// @param target Vector to transmit
/// @param lastDispatched Vector the sink is known to hold; nullopt forces Full
/// @param mode Diff or Full
/// @param sink Supplies the accepted range per field
[[nodiscard]] std::vector<ParameterCommand> planDispatch(const FormantVector& target,
                                                         const std::optional<FormantVector>& lastDispatched,
                                                         DispatchMode mode,
                                                         const ICommandSink& sink);

/// Result of sending a planned command list
struct SendOutcome {
    size_t sent = 0;  ///< Commands accepted before the first failure
    Status status;
};

/// Send commands in order, stopping at the first failure
[[nodiscard]] SendOutcome sendCommands(ICommandSink& sink, const std::vector<ParameterCommand>& commands);

} // namespace VoiceShaper
