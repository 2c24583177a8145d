#pragma once

// ==============================================================================
// Control Events
// ==============================================================================
// Discrete inputs to the ControlLoop. Any thread may post them; they are
// applied in order on the control thread.
// ==============================================================================

#include "io/preset_slot_store.h"
#include "io/wav_reader.h"
#include "model/pad_point.h"

#include <cstdint>
#include <string>
#include <variant>

namespace VoiceShaper {

enum class Slider : uint8_t {
    Brightness,
    Resonance
};

namespace Events {

struct PadMoved {
    PadPoint point;
};

struct SliderChanged {
    Slider slider = Slider::Brightness;
    float value = 0.0f;
};

struct ProfileSelected {
    std::string name;
};

/// Flip between base and processed; always followed by a full dispatch
struct ToggleRequested {};

/// Read a slot and make it the base preset
struct CaptureBaseRequested {
    SlotId slot = 0;
};

/// Write the currently selected vector to a slot
struct SaveSlotRequested {
    SlotId slot = 0;
};

struct CopySlotRequested {
    SlotId source = 0;
    SlotId target = 0;
};

/// Start fingerprinting a decoded clip in the background
struct WavLoaded {
    WavData wav;
    std::string label;
};

/// Move the pad to the last fingerprint's point
struct SnapToFingerprint {};

/// Send the full current vector again, e.g. after a DispatchFailure
struct ResendRequested {};

} // namespace Events

using ControlEvent = std::variant<Events::PadMoved,
                                  Events::SliderChanged,
                                  Events::ProfileSelected,
                                  Events::ToggleRequested,
                                  Events::CaptureBaseRequested,
                                  Events::SaveSlotRequested,
                                  Events::CopySlotRequested,
                                  Events::WavLoaded,
                                  Events::SnapToFingerprint,
                                  Events::ResendRequested>;

} // namespace VoiceShaper
