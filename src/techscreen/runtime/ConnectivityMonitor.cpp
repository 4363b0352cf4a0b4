#include <techscreen/runtime/ConnectivityMonitor.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <utility>

namespace TS::Runtime {

ConnectivityMonitor::ConnectivityMonitor(Sync::ActionJournal& journal, Sync::SyncCoordinator& coordinator)
    : journal_(journal), coordinator_(coordinator) {}

void ConnectivityMonitor::post(bool online) {
    std::lock_guard<std::mutex> lock(mailboxMutex_);
    mailbox_.push_back(online);
}

auto ConnectivityMonitor::pendingObservations() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mailboxMutex_);
    return mailbox_.size();
}

auto ConnectivityMonitor::pump() -> ConnectivityPumpResult {
    std::deque<bool> observations;
    {
        std::lock_guard<std::mutex> lock(mailboxMutex_);
        observations.swap(mailbox_);
    }

    ConnectivityPumpResult result;
    for (auto const online : observations) {
        auto const before = journal_.isOnline();
        if (before == online) {
            continue;
        }
        ++result.transitions;
        auto const reconnected = journal_.setOnline(online);
        ts_log(online ? "Connectivity restored" : "Connectivity lost", "Connectivity");
        if (reconnected) {
            result.flush = coordinator_.onReconnected();
            if (!*result.flush) {
                ts_log("Reconnect flush failed: " + describeError(result.flush->error()), "Connectivity", "ERROR");
            }
        }
    }
    return result;
}

} // namespace TS::Runtime
