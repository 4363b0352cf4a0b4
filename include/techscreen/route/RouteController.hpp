#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/route/Job.hpp>
#include <techscreen/sync/OfflineActionQueue.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TS::Route {

struct SkipIntent {
    std::string jobId;

    bool operator==(SkipIntent const&) const = default;
};

struct MoveIntent {
    std::string jobId;
    std::size_t fromIndex = 0;
    std::size_t toIndex   = 0;

    bool operator==(MoveIntent const&) const = default;
};

using PendingIntent = std::variant<SkipIntent, MoveIntent>;

struct Idle {
    bool operator==(Idle const&) const = default;
};

struct AwaitingReason {
    PendingIntent intent;

    bool operator==(AwaitingReason const&) const = default;
};

// At most one reason-gated request is outstanding at any time.
using IntentState = std::variant<Idle, AwaitingReason>;

[[nodiscard]] auto describe_intent(PendingIntent const& intent) -> std::string;

/**
 * Owns the ordered job list for a route and enforces the job lifecycle.
 *
 *   pending/skipped --start--> inProgress --complete(signature)--> completed
 *   any --skip(reason)--> skipped
 *
 * Skips and moves are two-phase: request*() records an intent without
 * touching any job, commit() applies it once a reason code is supplied, and
 * cancel() drops it. A new request replaces an outstanding intent and hands
 * the replaced one back to the caller. Every applied mutation is recorded
 * through the journal, which queues it while offline. Rejected operations
 * leave all state untouched and return an Error.
 */
class RouteController {
public:
    using NowFn = std::function<TimePoint()>;

    RouteController(std::vector<Job> jobs, Sync::ActionJournal& journal, NowFn now = {});

    [[nodiscard]] auto jobs() const -> std::vector<Job> const& { return jobs_; }
    [[nodiscard]] auto findJob(std::string_view jobId) const -> Job const*;
    [[nodiscard]] auto firstJobWithStatus(JobStatus status) const -> Job const*;

    auto start(std::string_view jobId) -> Expected<void>;
    auto complete(std::string_view jobId, std::string signature) -> Expected<void>;

    auto requestSkip(std::string_view jobId) -> Expected<std::optional<PendingIntent>>;
    auto requestMove(std::size_t fromIndex, std::size_t toIndex) -> Expected<std::optional<PendingIntent>>;
    auto commit(ReasonCode reason) -> Expected<PendingIntent>;
    auto cancel() -> std::optional<PendingIntent>;

    [[nodiscard]] auto intentState() const -> IntentState const& { return intent_; }
    [[nodiscard]] auto awaitingReason() const -> bool { return std::holds_alternative<AwaitingReason>(intent_); }

    auto startRoute() -> Expected<void>;
    auto endRoute() -> Expected<void>;
    [[nodiscard]] auto routeStarted() const -> bool { return routeStartTime_.has_value(); }
    [[nodiscard]] auto routeStartTime() const -> std::optional<TimePoint> { return routeStartTime_; }

    [[nodiscard]] auto completedJobsCount() const -> std::size_t;
    // Pending plus in progress.
    [[nodiscard]] auto remainingJobsCount() const -> std::size_t;
    // Completed share of all jobs in [0, 1]; 0 for an empty route.
    [[nodiscard]] auto completionFraction() const -> double;

private:
    auto indexOf(std::string_view jobId) const -> std::optional<std::size_t>;
    auto replaceIntent(PendingIntent intent) -> std::optional<PendingIntent>;
    void record(Sync::ActionKind kind,
                std::optional<std::string> jobId,
                std::optional<std::string> key,
                std::optional<std::string> value,
                std::optional<std::string> reason = std::nullopt);

    std::vector<Job>         jobs_;
    Sync::ActionJournal&     journal_;
    NowFn                    now_;
    IntentState              intent_ = Idle{};
    std::optional<TimePoint> routeStartTime_;
};

} // namespace TS::Route
