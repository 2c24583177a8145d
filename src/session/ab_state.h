#pragma once

// ==============================================================================
// ABSession - Base / Processed Snapshots
// ==============================================================================
// Holds the captured base preset and the processed preset and selects which
// of them is current. Both start unset. The base changes only through
// setCapturedBase(); nothing here derives one snapshot from the other.
//
// Owned by the control thread; not thread safe.
// ==============================================================================

#include "engine/pad_interpolation.h"
#include "io/command_sink.h"
#include "model/errors.h"
#include "model/formant_vector.h"

#include <cstdint>
#include <optional>

namespace VoiceShaper {

enum class ABState : uint8_t {
    Base,      ///< Processing disabled: hardware holds the captured base
    Processed  ///< Processing enabled: hardware holds the pad result
};

[[nodiscard]] constexpr const char* abStateName(ABState state) noexcept {
    return state == ABState::Base ? "Base" : "Processed";
}

[[nodiscard]] constexpr ABState otherState(ABState state) noexcept {
    return state == ABState::Base ? ABState::Processed : ABState::Base;
}

class ABSession {
public:
    ABSession() noexcept = default;
    explicit ABSession(ABState initial) noexcept : state_(initial) {}

    void setCapturedBase(const FormantVector& v) { base_ = v; }
    void setProcessed(const FormantVector& v) { processed_ = v; }

    /// Flip the selection and return the new state
    ABState toggle() noexcept {
        state_ = otherState(state_);
        return state_;
    }

    [[nodiscard]] ABState state() const noexcept { return state_; }

    [[nodiscard]] const BasePreset& base() const noexcept { return base_; }
    [[nodiscard]] const std::optional<FormantVector>& processed() const noexcept { return processed_; }

    [[nodiscard]] const std::optional<FormantVector>& vector(ABState state) const noexcept {
        return state == ABState::Base ? base_ : processed_;
    }

    /// Vector selected by the current state
    [[nodiscard]] const std::optional<FormantVector>& current() const noexcept { return vector(state_); }

    /// @brief Send the full current vector, in dispatch order, synchronously
    /// @return MissingBase when nothing is selected, DispatchFailure from the sink
    [[nodiscard]] Status dispatch(ICommandSink& sink) const;

private:
    ABState state_ = ABState::Processed;
    BasePreset base_;
    std::optional<FormantVector> processed_;
};

} // namespace VoiceShaper
