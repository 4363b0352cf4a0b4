#include <techscreen/sync/OfflineActionQueue.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <iterator>

namespace TS::Sync {

void OfflineActionQueue::enqueue(PendingAction action) {
    ts_log("Queued " + describe_action(action), "Queue");
    actions_.push_back(std::move(action));
}

auto OfflineActionQueue::drain() -> std::vector<PendingAction> {
    std::vector<PendingAction> drained{std::make_move_iterator(actions_.begin()),
                                       std::make_move_iterator(actions_.end())};
    actions_.clear();
    ts_log("Drained " + std::to_string(drained.size()) + " actions", "Queue");
    return drained;
}

void OfflineActionQueue::restoreFront(std::vector<PendingAction> actions) {
    actions_.insert(actions_.begin(),
                    std::make_move_iterator(actions.begin()),
                    std::make_move_iterator(actions.end()));
}

auto OfflineActionQueue::snapshot() const -> std::vector<PendingAction> {
    return {actions_.begin(), actions_.end()};
}

auto ActionJournal::setOnline(bool online) -> bool {
    auto const reconnected = online && !online_;
    online_                = online;
    return reconnected;
}

auto ActionJournal::record(PendingAction action) -> bool {
    if (online_) {
        return false;
    }
    queue_.enqueue(std::move(action));
    return true;
}

} // namespace TS::Sync
