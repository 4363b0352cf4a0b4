#include <techscreen/tools/SyncReplay.hpp>

#include <techscreen/log/TaggedLogger.hpp>
#include <techscreen/tools/InspectOptions.hpp>

#include <string>
#include <utility>

namespace TS::Tools {

namespace {

class RecordingTransport final : public Sync::SyncTransport {
public:
    auto deliver(Sync::PendingAction const& action) -> Expected<void> override {
        delivered.push_back(Sync::EncodePendingAction(action));
        return {};
    }

    nlohmann::json delivered = nlohmann::json::array();
};

} // namespace

auto ReplayPendingActions(Sync::ActionJournal& journal, Sync::SyncPolicy const& policy) -> Expected<nlohmann::json> {
    auto const queued = journal.queue().size();
    journal.setOnline(true);

    RecordingTransport    transport;
    Sync::SyncCoordinator coordinator{journal, transport, policy};
    auto                  delivered = coordinator.onReconnected();
    if (!delivered) {
        return std::unexpected(delivered.error());
    }
    ts_log("Replayed " + std::to_string(*delivered) + " of " + std::to_string(queued) + " queued actions", "Sync");

    auto backoff = nlohmann::json::array();
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        backoff.push_back(coordinator.backoffFor(attempt).count());
    }
    return nlohmann::json{{"compaction", std::string{compaction_mode_name(policy.compaction)}},
                          {"queued", queued},
                          {"delivered", std::move(transport.delivered)},
                          {"backoffMs", std::move(backoff)}};
}

} // namespace TS::Tools
