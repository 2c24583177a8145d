#pragma once

// ==============================================================================
// ControlLoop - Single-Writer Session State
// ==============================================================================
// Owns the session: pad position, sliders, active profile, the A/B snapshots
// and the last fingerprint. Events are queued by post() from any thread and
// applied by processPending() on the control thread, which recomputes the
// processed vector synchronously and hands dispatch to the throttler.
//
// Slow work never runs here: fingerprinting happens in an AnalysisTask and
// sending in the DispatchThrottler. poll() collects what they produced.
//
// Rules:
//   - Invalid input (pad, slider, profile) is rejected and leaves state as is
//   - Without a base, inputs are stored but nothing is computed or sent
//   - Pad and slider changes send a diff of the processed vector, and only
//     while Processed is selected
//   - A toggle sends the newly selected vector in full
//   - A fingerprint never moves the pad until SnapToFingerprint
// ==============================================================================

#include "analysis/fingerprint_extractor.h"
#include "config/engine_config.h"
#include "engine/pad_interpolation.h"
#include "io/command_sink.h"
#include "io/preset_slot_store.h"
#include "model/errors.h"
#include "model/pad_point.h"
#include "model/voice_profile.h"
#include "session/ab_state.h"
#include "session/analysis_task.h"
#include "session/control_events.h"
#include "session/dispatch_throttler.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace VoiceShaper {

/// Outcome of one handled event
struct EventOutcome {
    size_t index = 0;  ///< Position in the processed batch
    Status status;
};

/// Background results collected by poll()
struct PollResult {
    std::optional<Result<Fingerprint>> analysis;  ///< Set when an analysis finished
    std::vector<DispatchReport> dispatches;

    [[nodiscard]] bool empty() const noexcept { return !analysis && dispatches.empty(); }
};

class ControlLoop {
public:
    /// @brief Create a loop on config.defaultProfile
    /// @return UnknownProfile when the default profile does not exist
    /// @note sink and slots must outlive the loop
    [[nodiscard]] static Result<std::unique_ptr<ControlLoop>> create(EngineConfig config,
                                                                     ICommandSink& sink,
                                                                     IPresetSlotStore& slots);
    ~ControlLoop();

    // Non-copyable, non-movable
    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;
    ControlLoop(ControlLoop&&) = delete;
    ControlLoop& operator=(ControlLoop&&) = delete;

    // =========================================================================
    // Event Input
    // =========================================================================

    /// Queue an event (thread safe)
    void post(ControlEvent event);

    /// Apply all queued events in order; returns one outcome per event
    std::vector<EventOutcome> processPending();

    /// Apply one event immediately (control thread only)
    Status handle(ControlEvent event);

    /// Collect a finished analysis and dispatch reports
    [[nodiscard]] PollResult poll();

    // =========================================================================
    // Control-thread Helpers
    // =========================================================================

    void cancelAnalysis() noexcept;

    [[nodiscard]] bool isAnalysisRunning() const noexcept { return analysis_.valid(); }

    /// Block until a running analysis has finished; false on timeout
    [[nodiscard]] bool waitForAnalysis(std::chrono::milliseconds timeout) const;

    /// Block until the throttler is idle; false on timeout
    [[nodiscard]] bool waitForDispatch(std::chrono::milliseconds timeout);

    // =========================================================================
    // State (read on the control thread)
    // =========================================================================

    [[nodiscard]] const ABSession& ab() const noexcept { return ab_; }
    [[nodiscard]] ABState abState() const noexcept { return ab_.state(); }
    [[nodiscard]] PadPoint pad() const noexcept { return pad_; }
    [[nodiscard]] float brightness() const noexcept { return brightness_; }
    [[nodiscard]] float resonance() const noexcept { return resonance_; }
    [[nodiscard]] const VoiceProfile& profile() const noexcept { return *profile_; }
    [[nodiscard]] const std::optional<Fingerprint>& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    ControlLoop(EngineConfig config, const VoiceProfile& profile,
                ICommandSink& sink, IPresetSlotStore& slots);

    struct Inputs {
        PadPoint pad;
        float brightness = 0.0f;
        float resonance = 0.0f;
        const VoiceProfile* profile = nullptr;
    };

    Status apply(Events::PadMoved& event);
    Status apply(Events::SliderChanged& event);
    Status apply(Events::ProfileSelected& event);
    Status apply(Events::ToggleRequested& event);
    Status apply(Events::CaptureBaseRequested& event);
    Status apply(Events::SaveSlotRequested& event);
    Status apply(Events::CopySlotRequested& event);
    Status apply(Events::WavLoaded& event);
    Status apply(Events::SnapToFingerprint& event);
    Status apply(Events::ResendRequested& event);

    /// Recompute with candidate inputs; commits them unless they are invalid
    Status update(const Inputs& inputs);

    /// Submit the processed vector if Processed is selected
    void dispatchProcessed();

    [[nodiscard]] Inputs currentInputs() const noexcept;

    EngineConfig config_;
    IPresetSlotStore& slots_;
    PadInterpolator interpolator_;
    FingerprintExtractor extractor_;

    PadPoint pad_;
    float brightness_ = 0.0f;
    float resonance_ = 0.0f;
    const VoiceProfile* profile_ = nullptr;
    ABSession ab_;
    std::optional<Fingerprint> fingerprint_;
    AnalysisTask analysis_;

    std::mutex queueMutex_;
    std::vector<ControlEvent> queue_;

    // Declared last: its worker stops before the state above goes away
    DispatchThrottler throttler_;
};

} // namespace VoiceShaper
