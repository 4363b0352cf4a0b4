#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/sync/OfflineActionQueue.hpp>
#include <techscreen/sync/SyncCoordinator.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace TS::Runtime {

struct ConnectivityPumpResult {
    std::size_t transitions = 0;
    // Outcome of the flush triggered by the last offline to online transition.
    std::optional<Expected<std::size_t>> flush;
};

/**
 * Bridges a reachability observer running on its own thread to the single
 * writer. post() may be called from any thread and only records the
 * observation. pump() runs on the owning actor, applies the observations in
 * order to the journal and, on each offline to online transition, hands the
 * queue to the sync coordinator.
 */
class ConnectivityMonitor {
public:
    ConnectivityMonitor(Sync::ActionJournal& journal, Sync::SyncCoordinator& coordinator);

    void post(bool online);
    auto pump() -> ConnectivityPumpResult;

    [[nodiscard]] auto pendingObservations() const -> std::size_t;

private:
    Sync::ActionJournal&   journal_;
    Sync::SyncCoordinator& coordinator_;

    mutable std::mutex mailboxMutex_;
    std::deque<bool>   mailbox_;
};

} // namespace TS::Runtime
