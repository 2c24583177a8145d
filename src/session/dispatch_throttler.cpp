#include "session/dispatch_throttler.h"

#include "logging/logger.h"

#include <utility>

namespace VoiceShaper {

DispatchThrottler::DispatchThrottler(ICommandSink& sink, DispatchConfig config)
    : sink_(sink)
    , config_(config)
    , worker_([this](std::stop_token stop) { run(stop); })
{
}

DispatchThrottler::~DispatchThrottler() {
    // Pending work is dropped; the jthread joins after this body
    worker_.request_stop();
}

uint64_t DispatchThrottler::submit(const FormantVector& vector, DispatchMode mode) {
    uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Request request;
        request.vector = vector;
        request.mode = mode;
        request.sequence = ++sequence_;

        if (pending_) {
            if (pending_->mode == DispatchMode::Full) {
                request.mode = DispatchMode::Full;
            }
            request.coalesced = pending_->coalesced + 1;
        }
        pending_ = request;
        sequence = request.sequence;
    }
    wake_.notify_one();
    return sequence;
}

bool DispatchThrottler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return !pending_ && !busy_; });
}

std::vector<DispatchReport> DispatchThrottler::takeReports() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(reports_, {});
}

void DispatchThrottler::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastDispatched_.reset();
}

std::optional<FormantVector> DispatchThrottler::lastDispatched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastDispatched_;
}

bool DispatchThrottler::isIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_ && !busy_;
}

// =============================================================================
// Worker
// =============================================================================

void DispatchThrottler::run(std::stop_token stop) {
    const auto minInterval = std::chrono::milliseconds(config_.minIntervalMs);

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop.stop_requested()) {
        if (!wake_.wait(lock, stop, [this] { return pending_.has_value(); })) {
            break;
        }

        // Rate limit. Submits arriving meanwhile replace pending_.
        if (lastStart_) {
            const auto earliest = *lastStart_ + minInterval;
            wake_.wait_until(lock, stop, earliest,
                             [earliest] { return std::chrono::steady_clock::now() >= earliest; });
            if (stop.stop_requested()) {
                break;
            }
        }

        const Request request = std::move(*pending_);
        pending_.reset();
        busy_ = true;

        std::optional<FormantVector> last;
        if (config_.diffingEnabled) {
            last = lastDispatched_;
        }

        const auto started = std::chrono::steady_clock::now();
        lock.unlock();
        DispatchReport report = execute(request, last);
        lock.lock();

        if (report.planned > 0) {
            lastStart_ = started;
        }
        if (report.status) {
            lastDispatched_ = request.vector;
        } else {
            lastDispatched_.reset();
        }
        if (reports_.size() >= kMaxReports) {
            reports_.erase(reports_.begin());
        }
        reports_.push_back(std::move(report));
        busy_ = false;

        if (!pending_) {
            idle_.notify_all();
        }
    }

    busy_ = false;
    idle_.notify_all();
}

DispatchReport DispatchThrottler::execute(const Request& request,
                                          const std::optional<FormantVector>& last) {
    DispatchReport report;
    report.sequence = request.sequence;
    report.mode = last ? request.mode : DispatchMode::Full;
    report.vector = request.vector;
    report.coalesced = request.coalesced;

    const auto commands = planDispatch(request.vector, last, report.mode, sink_);
    report.planned = commands.size();

    if (commands.empty()) {
        Log::logger()->debug("dispatch #{} skipped: no field changed", request.sequence);
        return report;
    }

    const auto outcome = sendCommands(sink_, commands);
    report.sent = outcome.sent;
    report.status = outcome.status;

    if (report.status) {
        Log::logger()->debug("dispatch #{} ({}): {} command(s), {} coalesced",
                             request.sequence, dispatchModeName(report.mode),
                             report.sent, report.coalesced);
    } else {
        Log::logger()->error("dispatch #{} failed after {}/{} command(s): {}",
                             request.sequence, report.sent, report.planned,
                             report.status.message);
    }
    return report;
}

} // namespace VoiceShaper
