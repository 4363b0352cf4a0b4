#pragma once

#include <techscreen/sync/PendingAction.hpp>

#include <cstddef>
#include <deque>
#include <vector>

namespace TS::Sync {

/**
 * Ordered, in-memory log of locally applied mutations. Producers only append;
 * actions are never merged or deduplicated here. drain() hands the whole log
 * over in insertion order and leaves the queue empty. Not thread-safe: owned
 * by the single writer that also mutates jobs and inputs.
 */
class OfflineActionQueue {
public:
    void enqueue(PendingAction action);
    [[nodiscard]] auto drain() -> std::vector<PendingAction>;
    // Puts undelivered actions back ahead of anything queued since the drain.
    void restoreFront(std::vector<PendingAction> actions);

    [[nodiscard]] auto size() const -> std::size_t { return actions_.size(); }
    [[nodiscard]] auto empty() const -> bool { return actions_.empty(); }
    [[nodiscard]] auto snapshot() const -> std::vector<PendingAction>;

private:
    std::deque<PendingAction> actions_;
};

// Connectivity flag plus the queue it gates. Every producer records through here.
class ActionJournal {
public:
    explicit ActionJournal(OfflineActionQueue& queue, bool online = true)
        : queue_(queue), online_(online) {}

    [[nodiscard]] auto isOnline() const -> bool { return online_; }
    // True when the call is an offline to online transition.
    auto setOnline(bool online) -> bool;
    // Appends while offline; returns whether the action was queued.
    auto record(PendingAction action) -> bool;

    [[nodiscard]] auto queue() -> OfflineActionQueue& { return queue_; }
    [[nodiscard]] auto queue() const -> OfflineActionQueue const& { return queue_; }

private:
    OfflineActionQueue& queue_;
    bool                online_;
};

} // namespace TS::Sync
