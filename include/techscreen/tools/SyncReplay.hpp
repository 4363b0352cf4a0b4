#pragma once

#include <techscreen/core/Error.hpp>
#include <techscreen/sync/SyncCoordinator.hpp>

#include <nlohmann/json.hpp>

namespace TS::Tools {

/**
 * Brings the journal online and flushes its queue through a SyncCoordinator
 * configured with policy, using a transport that records instead of sending.
 * The report lists the compaction mode, how many actions were queued, the
 * actions in delivery order and the backoff schedule the policy would use.
 * The queue is empty afterwards.
 */
[[nodiscard]] auto ReplayPendingActions(Sync::ActionJournal& journal, Sync::SyncPolicy const& policy)
    -> Expected<nlohmann::json>;

} // namespace TS::Tools
