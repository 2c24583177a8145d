#pragma once
// ==============================================================================
// Recording Command Sink
// ==============================================================================
// ICommandSink that records every command it accepts. Can be told to fail
// from the Nth command on, and to hold each send for a while to imitate a
// slow serial link. Safe to read from the test thread while a dispatch
// worker sends.
// ==============================================================================

#include "io/command_sink.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace TestHelpers {

class RecordingSink : public VoiceShaper::ICommandSink {
public:
    [[nodiscard]] VoiceShaper::ParameterRange acceptedRange(VoiceShaper::FormantField field) const override {
        switch (VoiceShaper::fieldKind(field)) {
            case VoiceShaper::FieldKind::Frequency: return {50.0f, 8000.0f};
            case VoiceShaper::FieldKind::Level:     return {0.0f, 63.0f};
            case VoiceShaper::FieldKind::Resonance: return {0.0f, 15.0f};
        }
        return {};
    }

    [[nodiscard]] VoiceShaper::Status send(const VoiceShaper::ParameterCommand& command) override {
        const int delayMs = delayMs_.load();
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (failFrom_ && attempts_ > *failFrom_) {
            return VoiceShaper::Status::failure(VoiceShaper::ErrorCode::DispatchFailure, "link down");
        }
        commands_.push_back(command);
        return VoiceShaper::Status::ok();
    }

    /// Accept this many more commands, then fail every send
    void failAfter(size_t accepted) {
        std::lock_guard<std::mutex> lock(mutex_);
        failFrom_ = attempts_ + accepted;
    }

    void recover() {
        std::lock_guard<std::mutex> lock(mutex_);
        failFrom_.reset();
    }

    void setDelay(std::chrono::milliseconds delay) { delayMs_ = static_cast<int>(delay.count()); }

    [[nodiscard]] std::vector<VoiceShaper::ParameterCommand> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    [[nodiscard]] size_t attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<VoiceShaper::ParameterCommand> commands_;
    size_t attempts_ = 0;
    std::optional<size_t> failFrom_;
    std::atomic<int> delayMs_{0};
};

} // namespace TestHelpers
