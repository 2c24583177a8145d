#include "session/dispatch_plan.h"

namespace VoiceShaper {

std::vector<ParameterCommand> planDispatch(const FormantVector& target,
                                           const std::optional<FormantVector>& lastDispatched,
                                           DispatchMode mode,
                                           const ICommandSink& sink) {
    const bool full = mode == DispatchMode::Full || !lastDispatched.has_value();

    std::vector<ParameterCommand> commands;
    commands.reserve(kNumFormantFields);

    for (FormantField field : kDispatchOrder) {
        const float value = target.value(field);
        if (!full && value == lastDispatched->value(field)) {
            continue;
        }
        commands.push_back({field, sink.acceptedRange(field).clamp(value)});
    }
    return commands;
}

SendOutcome sendCommands(ICommandSink& sink, const std::vector<ParameterCommand>& commands) {
    SendOutcome outcome;
    for (const auto& command : commands) {
        outcome.status = sink.send(command);
        if (!outcome.status) {
            break;
        }
        ++outcome.sent;
    }
    return outcome;
}

} // namespace VoiceShaper
