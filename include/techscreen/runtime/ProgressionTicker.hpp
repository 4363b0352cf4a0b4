#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/route/RouteController.hpp>
#include <techscreen/runtime/PollLoop.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace TS::Runtime {

struct ProgressionOptions {
    std::chrono::seconds first_delay{3};
    std::chrono::seconds interval{5};
    // How long a job stays in progress before it is completed.
    std::chrono::seconds dwell{120};
    std::string          signature = "Demo Signature Data";
};

enum class ProgressionStep {
    Waiting,
    Started,
    Completed,
    Finished,
};

[[nodiscard]] auto progression_step_name(ProgressionStep step) -> std::string_view;

// Simulated technician: finishes the in-progress job once it has dwelt long
// enough, otherwise starts the next pending job.
class ProgressionTicker {
public:
    ProgressionTicker(Route::RouteController& controller, ProgressionOptions options = {});

    auto tick(Route::TimePoint now) -> Expected<ProgressionStep>;
    [[nodiscard]] auto options() const -> ProgressionOptions const& { return options_; }

private:
    Route::RouteController& controller_;
    ProgressionOptions      options_;
};

/**
 * Scope of one demo run. While alive it keeps a task on the poll loop that
 * ticks every `interval`; the task retires itself once no job is pending or
 * in progress. Destroying the session (or stop()) removes the task, so no
 * tick can mutate the route afterwards.
 */
class ProgressionSession {
public:
    ProgressionSession(PollLoop& loop,
                       Route::RouteController& controller,
                       Route::TimePoint startedAt,
                       ProgressionOptions options = {});
    ~ProgressionSession();

    ProgressionSession(ProgressionSession const&)            = delete;
    ProgressionSession& operator=(ProgressionSession const&) = delete;

    void stop();
    [[nodiscard]] auto active() const -> bool { return handle_.scheduled(); }
    [[nodiscard]] auto ticks() const -> std::size_t { return ticks_; }
    [[nodiscard]] auto lastError() const -> std::optional<Error> const& { return lastError_; }

private:
    auto poll(Route::TimePoint now) -> bool;

    ProgressionTicker    ticker_;
    Route::TimePoint     nextDue_;
    std::size_t          ticks_ = 0;
    std::optional<Error> lastError_;
    PollLoop::Handle     handle_;
};

} // namespace TS::Runtime
