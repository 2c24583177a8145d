#pragma once

// ==============================================================================
// AnalysisTask - Cancellable Background Fingerprint
// ==============================================================================
// Runs FingerprintExtractor::analyze() on its own thread and hands the result
// back through a future. The task owns copies of everything it reads; the
// only thing it shares with the caller is the future.
//
// cancel() stops the analysis at the next frame boundary; the result is then
// Cancelled and partial spectra are discarded. Destroying a running task
// cancels and joins it.
// ==============================================================================

#include "analysis/fingerprint_extractor.h"
#include "io/wav_reader.h"
#include "model/errors.h"

#include <chrono>
#include <future>
#include <string>
#include <thread>

namespace VoiceShaper {

class AnalysisTask {
public:
    AnalysisTask() noexcept = default;

    /// Start analysing wav; label is used in log lines only
    AnalysisTask(FingerprintExtractor extractor, WavData wav, std::string label = {});

    ~AnalysisTask() = default;

    // Non-copyable, movable
    AnalysisTask(const AnalysisTask&) = delete;
    AnalysisTask& operator=(const AnalysisTask&) = delete;
    AnalysisTask(AnalysisTask&&) noexcept = default;
    AnalysisTask& operator=(AnalysisTask&&) noexcept = default;

    /// True until the result has been taken
    [[nodiscard]] bool valid() const noexcept { return result_.valid(); }

    /// Result available without blocking
    [[nodiscard]] bool isReady() const;

    /// Wait up to timeout for the result
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    /// Ask the worker to stop at the next frame
    void cancel() noexcept;

    /// Block for the result and release it. Requires valid().
    [[nodiscard]] Result<Fingerprint> get();

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    std::string label_;
    std::future<Result<Fingerprint>> result_;
    std::jthread worker_;
};

} // namespace VoiceShaper
