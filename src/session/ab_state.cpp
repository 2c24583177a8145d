#include "session/ab_state.h"

#include "session/dispatch_plan.h"

namespace VoiceShaper {

Status ABSession::dispatch(ICommandSink& sink) const {
    const auto& selected = current();
    if (!selected) {
        return Status::failure(ErrorCode::MissingBase,
                               std::string("no ") + abStateName(state_) + " vector to dispatch");
    }

    const auto commands = planDispatch(*selected, std::nullopt, DispatchMode::Full, sink);
    return sendCommands(sink, commands).status;
}

} // namespace VoiceShaper
