#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/sync/OfflineActionQueue.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace TS::Sync {

// Remote side of the queue. Implementations deliver one action at a time.
class SyncTransport {
public:
    virtual ~SyncTransport() = default;
    [[nodiscard]] virtual auto deliver(PendingAction const& action) -> Expected<void> = 0;
};

enum class CompactionMode {
    ReplayAll,
    // Keeps only the newest input action per (kind, key); lifecycle actions are untouched.
    LastWriteWins,
};

struct SyncPolicy {
    int                       max_attempts       = 5;
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{30'000};
    double                    backoff_multiplier = 2.0;
    CompactionMode            compaction         = CompactionMode::ReplayAll;
};

[[nodiscard]] auto compact_actions(std::vector<PendingAction> actions) -> std::vector<PendingAction>;

class SyncCoordinator {
public:
    using NowFn = std::function<Route::TimePoint()>;

    SyncCoordinator(ActionJournal& journal, SyncTransport& transport, SyncPolicy policy = {}, NowFn now = {});

    /**
     * Delivers the queue in insertion order while online. The first failed
     * delivery stops the pass: it and everything after it go back to the
     * front of the queue, the attempt counter grows and a retry is scheduled
     * with exponential backoff. Once max_attempts is reached the coordinator
     * stops retrying until reset() or the next reconnect; the actions remain
     * queued. Returns the number of actions delivered.
     */
    auto flush() -> Expected<std::size_t>;

    // Retries a scheduled flush when it is due. nullopt when nothing ran.
    auto pump(Route::TimePoint now) -> std::optional<Expected<std::size_t>>;

    // Connectivity came back: clear the retry budget and flush immediately.
    auto onReconnected() -> Expected<std::size_t>;
    void reset();

    [[nodiscard]] auto attempts() const -> int { return attempts_; }
    [[nodiscard]] auto gaveUp() const -> bool { return gave_up_; }
    [[nodiscard]] auto nextAttempt() const -> std::optional<Route::TimePoint> { return next_attempt_; }
    [[nodiscard]] auto backoffFor(int attempt) const -> std::chrono::milliseconds;

private:
    ActionJournal&                  journal_;
    SyncTransport&                  transport_;
    SyncPolicy                      policy_;
    NowFn                           now_;
    int                             attempts_ = 0;
    bool                            gave_up_  = false;
    std::optional<Route::TimePoint> next_attempt_;
};

} // namespace TS::Sync
