#include "session/analysis_task.h"

#include "logging/logger.h"

#include <utility>

namespace VoiceShaper {

AnalysisTask::AnalysisTask(FingerprintExtractor extractor, WavData wav, std::string label)
    : label_(std::move(label))
{
    std::promise<Result<Fingerprint>> promise;
    result_ = promise.get_future();

    worker_ = std::jthread(
        [extractor, wav = std::move(wav), promise = std::move(promise), label = label_](
            std::stop_token stop) mutable {
            Log::logger()->debug("analysis of '{}' started", label);
            auto result = extractor.analyze(wav, stop);
            if (result.error == ErrorCode::Cancelled) {
                Log::logger()->info("analysis of '{}' cancelled", label);
            }
            promise.set_value(std::move(result));
        });
}

bool AnalysisTask::isReady() const {
    return waitFor(std::chrono::milliseconds(0));
}

bool AnalysisTask::waitFor(std::chrono::milliseconds timeout) const {
    return result_.valid() && result_.wait_for(timeout) == std::future_status::ready;
}

void AnalysisTask::cancel() noexcept {
    worker_.request_stop();
}

Result<Fingerprint> AnalysisTask::get() {
    auto result = result_.get();
    if (worker_.joinable()) {
        worker_.join();
    }
    return result;
}

} // namespace VoiceShaper
