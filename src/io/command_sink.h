#pragma once

// ==============================================================================
// ICommandSink - Outbound Parameter Commands
// ==============================================================================
// The librarian accepts one "set parameter" command at a time, each naming a
// single formant field and a value. Implementations report the numeric range
// they accept per field; the dispatcher clamps into it before sending.
//
// send() is called from the dispatch worker thread only.
// ==============================================================================

#include "model/errors.h"
#include "model/formant_vector.h"

#include <string_view>

namespace VoiceShaper {

struct ParameterCommand {
    FormantField field = FormantField::F1;
    float value = 0.0f;

    [[nodiscard]] std::string_view name() const noexcept { return fieldName(field); }

    [[nodiscard]] bool operator==(const ParameterCommand& other) const noexcept = default;
};

class ICommandSink {
public:
    virtual ~ICommandSink() = default;

    /// Range the destination accepts for a field
    [[nodiscard]] virtual ParameterRange acceptedRange(FormantField field) const = 0;

    /// Transmit one command; DispatchFailure when unreachable or rejected
    [[nodiscard]] virtual Status send(const ParameterCommand& command) = 0;
};

} // namespace VoiceShaper
