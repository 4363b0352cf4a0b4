#include <techscreen/runtime/ProgressionTicker.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <utility>

namespace TS::Runtime {

auto progression_step_name(ProgressionStep step) -> std::string_view {
    switch (step) {
    case ProgressionStep::Waiting:
        return "waiting";
    case ProgressionStep::Started:
        return "started";
    case ProgressionStep::Completed:
        return "completed";
    case ProgressionStep::Finished:
        return "finished";
    }
    return "waiting";
}

ProgressionTicker::ProgressionTicker(Route::RouteController& controller, ProgressionOptions options)
    : controller_(controller), options_(std::move(options)) {}

auto ProgressionTicker::tick(Route::TimePoint now) -> Expected<ProgressionStep> {
    if (auto const* active = controller_.firstJobWithStatus(Route::JobStatus::InProgress)) {
        if (!active->startTime || now - *active->startTime <= options_.dwell) {
            return ProgressionStep::Waiting;
        }
        auto const jobId = active->id;
        if (auto completed = controller_.complete(jobId, options_.signature); !completed) {
            return std::unexpected(completed.error());
        }
        ts_log("Demo completed " + jobId, "Progression");
        return ProgressionStep::Completed;
    }

    if (auto const* pending = controller_.firstJobWithStatus(Route::JobStatus::Pending)) {
        auto const jobId = pending->id;
        if (auto started = controller_.start(jobId); !started) {
            return std::unexpected(started.error());
        }
        ts_log("Demo started " + jobId, "Progression");
        return ProgressionStep::Started;
    }
    return ProgressionStep::Finished;
}

ProgressionSession::ProgressionSession(PollLoop& loop,
                                       Route::RouteController& controller,
                                       Route::TimePoint startedAt,
                                       ProgressionOptions options)
    : ticker_(controller, std::move(options)), nextDue_(startedAt + ticker_.options().first_delay) {
    handle_ = loop.schedule([this](Route::TimePoint now) { return poll(now); });
}

ProgressionSession::~ProgressionSession() {
    stop();
}

void ProgressionSession::stop() {
    if (handle_.scheduled()) {
        ts_log("Progression session stopped after " + std::to_string(ticks_) + " ticks", "Progression");
    }
    handle_.cancel();
}

auto ProgressionSession::poll(Route::TimePoint now) -> bool {
    if (now < nextDue_) {
        return true;
    }
    ++ticks_;
    nextDue_  = now + ticker_.options().interval;
    auto step = ticker_.tick(now);
    if (!step) {
        lastError_ = step.error();
        ts_log("Progression tick failed: " + describeError(step.error()), "Progression", "ERROR");
        return false;
    }
    return *step != ProgressionStep::Finished;
}

} // namespace TS::Runtime
