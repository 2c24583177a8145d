#pragma once

// ==============================================================================
// DispatchThrottler - Coalescing Background Dispatcher
// ==============================================================================
// The librarian takes one parameter change at a time over a slow link, so
// pad drags must not queue up commands. The throttler keeps a single pending
// request; each submit() replaces it. One worker thread drains it:
//
//   - at most one dispatch in flight
//   - dispatch starts are spaced at least minIntervalMs apart
//   - a pending Full request stays Full when later Diff requests replace it
//   - Diff sends only fields that changed since the last successful dispatch
//   - a failed dispatch forgets the last vector, so the next one is Full
//
// submit() never blocks on the sink. Results come back as DispatchReports,
// drained by takeReports(); only the newest kMaxReports are kept between
// calls. The sink must outlive the throttler.
// ==============================================================================

#include "config/engine_config.h"
#include "io/command_sink.h"
#include "model/errors.h"
#include "model/formant_vector.h"
#include "session/dispatch_plan.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace VoiceShaper {

struct DispatchReport {
    uint64_t sequence = 0;     ///< Sequence number of the request that ran
    DispatchMode mode = DispatchMode::Full;
    FormantVector vector;
    size_t planned = 0;        ///< Commands in the plan (0 = nothing changed)
    size_t sent = 0;           ///< Commands accepted by the sink
    size_t coalesced = 0;      ///< Earlier requests this one replaced
    Status status;
};

class DispatchThrottler {
public:
    static constexpr size_t kMaxReports = 64;

    explicit DispatchThrottler(ICommandSink& sink, DispatchConfig config = {});
    ~DispatchThrottler();

    // Non-copyable, non-movable (worker holds this)
    DispatchThrottler(const DispatchThrottler&) = delete;
    DispatchThrottler& operator=(const DispatchThrottler&) = delete;
    DispatchThrottler(DispatchThrottler&&) = delete;
    DispatchThrottler& operator=(DispatchThrottler&&) = delete;

    /// @brief Replace the pending request
    /// @return Sequence number of the request
    uint64_t submit(const FormantVector& vector, DispatchMode mode);

    /// Block until nothing is pending or in flight; false on timeout
    [[nodiscard]] bool waitIdle(std::chrono::milliseconds timeout);

    /// Reports finished since the last call, oldest first (at most kMaxReports)
    [[nodiscard]] std::vector<DispatchReport> takeReports();

    /// Forget the last dispatched vector; the next dispatch is Full
    void invalidate();

    /// Vector the sink is believed to hold
    [[nodiscard]] std::optional<FormantVector> lastDispatched() const;

    [[nodiscard]] bool isIdle() const;

    [[nodiscard]] const DispatchConfig& config() const noexcept { return config_; }

private:
    struct Request {
        FormantVector vector;
        DispatchMode mode = DispatchMode::Diff;
        uint64_t sequence = 0;
        size_t coalesced = 0;
    };

    void run(std::stop_token stop);
    DispatchReport execute(const Request& request, const std::optional<FormantVector>& last);

    ICommandSink& sink_;
    DispatchConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::condition_variable_any idle_;

    std::optional<Request> pending_;
    std::optional<FormantVector> lastDispatched_;
    std::vector<DispatchReport> reports_;
    std::optional<std::chrono::steady_clock::time_point> lastStart_;
    uint64_t sequence_ = 0;
    bool busy_ = false;

    // Last member: started after, and joined before, everything above
    std::jthread worker_;
};

} // namespace VoiceShaper
