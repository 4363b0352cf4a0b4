#include <techscreen/sync/SyncCoordinator.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <string>
#include <utility>

namespace TS::Sync {

auto compact_actions(std::vector<PendingAction> actions) -> std::vector<PendingAction> {
    std::set<std::pair<ActionKind, std::string>> seen;
    std::vector<PendingAction>                   kept;
    kept.reserve(actions.size());
    for (auto it = actions.rbegin(); it != actions.rend(); ++it) {
        if (is_input_action(it->kind) && it->key) {
            if (!seen.emplace(it->kind, *it->key).second) {
                continue;
            }
        }
        kept.push_back(std::move(*it));
    }
    std::reverse(kept.begin(), kept.end());
    return kept;
}

SyncCoordinator::SyncCoordinator(ActionJournal& journal, SyncTransport& transport, SyncPolicy policy, NowFn now)
    : journal_(journal), transport_(transport), policy_(policy), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Route::Clock::now(); };
    }
}

auto SyncCoordinator::backoffFor(int attempt) const -> std::chrono::milliseconds {
    if (attempt <= 1) {
        return std::min(policy_.initial_backoff, policy_.max_backoff);
    }
    auto const scaled = static_cast<double>(policy_.initial_backoff.count())
                        * std::pow(policy_.backoff_multiplier, static_cast<double>(attempt - 1));
    auto const cap = static_cast<double>(policy_.max_backoff.count());
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::min(scaled, cap))};
}

auto SyncCoordinator::flush() -> Expected<std::size_t> {
    if (!journal_.isOnline()) {
        return std::unexpected(Error{Error::Code::DeliveryFailed, "cannot flush while offline"});
    }
    if (gave_up_) {
        return std::unexpected(Error{Error::Code::RetryLimitReached,
                                     "gave up after " + std::to_string(attempts_) + " attempts"});
    }

    auto actions = journal_.queue().drain();
    if (policy_.compaction == CompactionMode::LastWriteWins) {
        actions = compact_actions(std::move(actions));
    }

    std::size_t delivered = 0;
    for (; delivered < actions.size(); ++delivered) {
        auto status = transport_.deliver(actions[delivered]);
        if (status) {
            continue;
        }

        std::vector<PendingAction> undelivered{std::make_move_iterator(actions.begin() + static_cast<std::ptrdiff_t>(delivered)),
                                               std::make_move_iterator(actions.end())};
        journal_.queue().restoreFront(std::move(undelivered));
        ++attempts_;
        ts_log("Delivery failed (attempt " + std::to_string(attempts_) + "): " + describeError(status.error()),
               "Sync",
               "ERROR");
        if (attempts_ >= policy_.max_attempts) {
            gave_up_ = true;
            next_attempt_.reset();
            return std::unexpected(Error{Error::Code::RetryLimitReached,
                                         "gave up after " + std::to_string(attempts_) + " attempts: "
                                             + status.error().message.value_or("")});
        }
        next_attempt_ = now_() + backoffFor(attempts_);
        return std::unexpected(Error{Error::Code::DeliveryFailed, status.error().message.value_or("delivery failed")});
    }

    attempts_ = 0;
    next_attempt_.reset();
    ts_log("Delivered " + std::to_string(delivered) + " actions", "Sync");
    return delivered;
}

auto SyncCoordinator::pump(Route::TimePoint now) -> std::optional<Expected<std::size_t>> {
    if (gave_up_ || !next_attempt_ || now < *next_attempt_ || !journal_.isOnline()) {
        return std::nullopt;
    }
    return flush();
}

auto SyncCoordinator::onReconnected() -> Expected<std::size_t> {
    reset();
    return flush();
}

void SyncCoordinator::reset() {
    attempts_ = 0;
    gave_up_  = false;
    next_attempt_.reset();
}

} // namespace TS::Sync
