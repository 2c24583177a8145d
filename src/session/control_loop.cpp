#include "session/control_loop.h"

#include "logging/logger.h"

#include <array>
#include <string_view>
#include <utility>
#include <variant>

namespace VoiceShaper {

namespace {

// Indexed by ControlEvent::index()
constexpr std::array<std::string_view, std::variant_size_v<ControlEvent>> kEventNames = {
    "PadMoved",
    "SliderChanged",
    "ProfileSelected",
    "ToggleRequested",
    "CaptureBaseRequested",
    "SaveSlotRequested",
    "CopySlotRequested",
    "WavLoaded",
    "SnapToFingerprint",
    "ResendRequested"
};

} // namespace

// =============================================================================
// Construction
// =============================================================================

Result<std::unique_ptr<ControlLoop>> ControlLoop::create(EngineConfig config,
                                                         ICommandSink& sink,
                                                         IPresetSlotStore& slots) {
    using R = Result<std::unique_ptr<ControlLoop>>;

    auto profile = VoiceProfileTable::instance().get(config.defaultProfile);
    if (!profile) {
        return R::forward(profile);
    }
    return R::success(std::unique_ptr<ControlLoop>(
        new ControlLoop(std::move(config), *profile.value, sink, slots)));
}

ControlLoop::ControlLoop(EngineConfig config, const VoiceProfile& profile,
                         ICommandSink& sink, IPresetSlotStore& slots)
    : config_(std::move(config))
    , slots_(slots)
    , interpolator_(config_.mapping)
    , extractor_(config_.fingerprint)
    , profile_(&profile)
    , throttler_(sink, config_.dispatch)
{
    Log::logger()->debug("control loop ready, profile {}", profile.name);
}

ControlLoop::~ControlLoop() {
    cancelAnalysis();
}

// =============================================================================
// Event Input
// =============================================================================

void ControlLoop::post(ControlEvent event) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push_back(std::move(event));
}

std::vector<EventOutcome> ControlLoop::processPending() {
    std::vector<ControlEvent> batch;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        batch.swap(queue_);
    }

    std::vector<EventOutcome> outcomes;
    outcomes.reserve(batch.size());

    for (size_t i = 0; i < batch.size(); ++i) {
        const auto name = kEventNames[batch[i].index()];
        Status status = handle(std::move(batch[i]));
        if (!status) {
            const auto level = status.error == ErrorCode::MissingBase ? spdlog::level::debug
                                                                       : spdlog::level::warn;
            Log::logger()->log(level, "{} rejected ({}): {}", name,
                               errorCodeName(status.error), status.message);
        }
        outcomes.push_back({i, std::move(status)});
    }
    return outcomes;
}

Status ControlLoop::handle(ControlEvent event) {
    return std::visit([this](auto& e) { return apply(e); }, event);
}

PollResult ControlLoop::poll() {
    PollResult out;

    if (analysis_.valid() && analysis_.isReady()) {
        const std::string label = analysis_.label();
        auto result = analysis_.get();

        if (result) {
            const Fingerprint& fp = result.value;
            fingerprint_ = fp;
            Log::logger()->info("fingerprint '{}': pad ({:.2f}, {:.2f}), centroid {:.0f} Hz, balance {:.1f} dB",
                                label, fp.point.x, fp.point.y, fp.centroidHz, fp.balanceDb);
            if (fp.isLowConfidence()) {
                Log::logger()->warn("fingerprint '{}' is low confidence (flags 0x{:02x}, rms {:.1f} dBFS)",
                                    label, fp.flags, fp.rmsDb);
            }
        } else if (result.error != ErrorCode::Cancelled) {
            Log::logger()->warn("analysis of '{}' failed ({}): {}", label,
                                errorCodeName(result.error), result.message);
        }
        out.analysis = std::move(result);
    }

    out.dispatches = throttler_.takeReports();
    return out;
}

void ControlLoop::cancelAnalysis() noexcept {
    analysis_.cancel();
}

bool ControlLoop::waitForAnalysis(std::chrono::milliseconds timeout) const {
    return !analysis_.valid() || analysis_.waitFor(timeout);
}

bool ControlLoop::waitForDispatch(std::chrono::milliseconds timeout) {
    return throttler_.waitIdle(timeout);
}

// =============================================================================
// Recompute
// =============================================================================

ControlLoop::Inputs ControlLoop::currentInputs() const noexcept {
    return Inputs{pad_, brightness_, resonance_, profile_};
}

Status ControlLoop::update(const Inputs& inputs) {
    auto result = interpolator_.compute(ab_.base(), inputs.pad, *inputs.profile,
                                        inputs.brightness, inputs.resonance);
    if (!result && result.error != ErrorCode::MissingBase) {
        return result.status();
    }

    pad_ = inputs.pad;
    brightness_ = inputs.brightness;
    resonance_ = inputs.resonance;
    profile_ = inputs.profile;

    if (!result) {
        return result.status();
    }

    ab_.setProcessed(result.value);
    dispatchProcessed();
    return Status::ok();
}

void ControlLoop::dispatchProcessed() {
    if (ab_.state() == ABState::Processed && ab_.processed()) {
        throttler_.submit(*ab_.processed(), DispatchMode::Diff);
    }
}

// =============================================================================
// Event Handlers
// =============================================================================

Status ControlLoop::apply(Events::PadMoved& event) {
    Inputs inputs = currentInputs();
    inputs.pad = event.point;
    return update(inputs);
}

Status ControlLoop::apply(Events::SliderChanged& event) {
    Inputs inputs = currentInputs();
    if (event.slider == Slider::Brightness) {
        inputs.brightness = event.value;
    } else {
        inputs.resonance = event.value;
    }
    return update(inputs);
}

Status ControlLoop::apply(Events::ProfileSelected& event) {
    auto profile = VoiceProfileTable::instance().get(event.name);
    if (!profile) {
        return profile.status();
    }

    Inputs inputs = currentInputs();
    inputs.profile = profile.value;
    Log::logger()->info("voice profile: {}", profile.value->name);
    return update(inputs);
}

Status ControlLoop::apply(Events::ToggleRequested&) {
    const ABState target = otherState(ab_.state());
    if (!ab_.vector(target)) {
        return Status::failure(ErrorCode::MissingBase,
                               std::string("cannot switch to ") + abStateName(target)
                                   + ": nothing captured yet");
    }

    ab_.toggle();
    Log::logger()->info("A/B: {} (processing {})", abStateName(ab_.state()),
                        ab_.state() == ABState::Processed ? "enabled" : "disabled");
    throttler_.submit(*ab_.current(), DispatchMode::Full);
    return Status::ok();
}

Status ControlLoop::apply(Events::CaptureBaseRequested& event) {
    auto read = slots_.readSlot(event.slot);
    if (!read) {
        return read.status();
    }

    ab_.setCapturedBase(read.value);
    Log::logger()->info("base captured from slot {}: {}", event.slot, toString(read.value));

    const Status status = update(currentInputs());
    if (ab_.state() == ABState::Base) {
        throttler_.submit(*ab_.base(), DispatchMode::Diff);
    }
    return status;
}

Status ControlLoop::apply(Events::SaveSlotRequested& event) {
    const auto& selected = ab_.current();
    if (!selected) {
        return Status::failure(ErrorCode::MissingBase,
                               std::string("no ") + abStateName(ab_.state()) + " vector to save");
    }

    Status status = slots_.writeSlot(event.slot, *selected);
    if (status) {
        Log::logger()->info("{} vector saved to slot {}", abStateName(ab_.state()), event.slot);
    }
    return status;
}

Status ControlLoop::apply(Events::CopySlotRequested& event) {
    Status status = copySlot(slots_, event.source, event.target);
    if (status) {
        Log::logger()->info("slot {} copied to slot {}", event.source, event.target);
    }
    return status;
}

Status ControlLoop::apply(Events::WavLoaded& event) {
    if (!event.wav.isMonoPcm()) {
        return Status::failure(ErrorCode::UnsupportedFormat,
                               "'" + event.label + "' has " + std::to_string(event.wav.channels)
                                   + " channel(s); mono PCM required");
    }

    if (analysis_.valid()) {
        Log::logger()->debug("superseding analysis of '{}'", analysis_.label());
        analysis_.cancel();
    }
    Log::logger()->info("analysing '{}' ({} frames at {} Hz)", event.label,
                        event.wav.frameCount(), event.wav.sampleRate);
    analysis_ = AnalysisTask(extractor_, std::move(event.wav), std::move(event.label));
    return Status::ok();
}

Status ControlLoop::apply(Events::SnapToFingerprint&) {
    if (!fingerprint_) {
        return Status::failure(ErrorCode::NoFingerprint, "no fingerprint to snap to");
    }

    Inputs inputs = currentInputs();
    inputs.pad = fingerprint_->point;
    return update(inputs);
}

Status ControlLoop::apply(Events::ResendRequested&) {
    const auto& selected = ab_.current();
    if (!selected) {
        return Status::failure(ErrorCode::MissingBase,
                               std::string("no ") + abStateName(ab_.state()) + " vector to resend");
    }
    throttler_.submit(*selected, DispatchMode::Full);
    return Status::ok();
}

} // namespace VoiceShaper
