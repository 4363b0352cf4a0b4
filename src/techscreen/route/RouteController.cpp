#include <techscreen/route/RouteController.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <algorithm>
#include <iterator>
#include <string>

namespace TS::Route {
namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto transition_error(Job const& job, std::string_view operation) -> Error {
    std::string message{operation};
    message.append(" not allowed for job ").append(job.id).append(" in status ").append(status_name(job.status));
    return Error{Error::Code::InvalidTransition, std::move(message)};
}

auto no_such_job(std::string_view jobId) -> Error {
    return Error{Error::Code::NoSuchJob, "no job with id " + std::string{jobId}};
}

} // namespace

auto describe_intent(PendingIntent const& intent) -> std::string {
    return std::visit(Overloaded{
                          [](SkipIntent const& skip) { return "skip " + skip.jobId; },
                          [](MoveIntent const& move) {
                              return "move " + move.jobId + " " + std::to_string(move.fromIndex) + "->"
                                     + std::to_string(move.toIndex);
                          },
                      },
                      intent);
}

RouteController::RouteController(std::vector<Job> jobs, Sync::ActionJournal& journal, NowFn now)
    : jobs_(std::move(jobs)), journal_(journal), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

auto RouteController::indexOf(std::string_view jobId) const -> std::optional<std::size_t> {
    auto const it = std::find_if(jobs_.begin(), jobs_.end(), [jobId](Job const& job) { return job.id == jobId; });
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(jobs_.begin(), it));
}

auto RouteController::findJob(std::string_view jobId) const -> Job const* {
    auto const index = indexOf(jobId);
    return index ? &jobs_[*index] : nullptr;
}

auto RouteController::firstJobWithStatus(JobStatus status) const -> Job const* {
    auto const it = std::find_if(jobs_.begin(), jobs_.end(), [status](Job const& job) { return job.status == status; });
    return it == jobs_.end() ? nullptr : &(*it);
}

auto RouteController::start(std::string_view jobId) -> Expected<void> {
    auto const index = indexOf(jobId);
    if (!index) {
        return std::unexpected(no_such_job(jobId));
    }
    auto& job = jobs_[*index];
    if (job.status != JobStatus::Pending && job.status != JobStatus::Skipped) {
        ts_log("Rejected start: " + describeError(transition_error(job, "start")), "Lifecycle");
        return std::unexpected(transition_error(job, "start"));
    }
    job.status    = JobStatus::InProgress;
    job.startTime = now_();
    ts_log("Started job " + job.id, "Lifecycle");
    record(Sync::ActionKind::Start, job.id, std::nullopt, std::nullopt);
    return {};
}

auto RouteController::complete(std::string_view jobId, std::string signature) -> Expected<void> {
    auto const index = indexOf(jobId);
    if (!index) {
        return std::unexpected(no_such_job(jobId));
    }
    auto& job = jobs_[*index];
    if (job.status != JobStatus::InProgress) {
        ts_log("Rejected complete: " + describeError(transition_error(job, "complete")), "Lifecycle");
        return std::unexpected(transition_error(job, "complete"));
    }
    if (signature.empty()) {
        return std::unexpected(Error{Error::Code::MissingSignature, "completing job " + job.id + " requires a signature"});
    }
    job.status         = JobStatus::Completed;
    job.completionTime = now_();
    job.signature      = std::move(signature);
    ts_log("Completed job " + job.id, "Lifecycle");
    record(Sync::ActionKind::Complete, job.id, std::nullopt, std::nullopt);
    return {};
}

auto RouteController::replaceIntent(PendingIntent intent) -> std::optional<PendingIntent> {
    std::optional<PendingIntent> replaced;
    if (auto* awaiting = std::get_if<AwaitingReason>(&intent_)) {
        replaced = std::move(awaiting->intent);
        ts_log("Replacing outstanding intent (" + describe_intent(*replaced) + ")", "Lifecycle");
    }
    intent_ = AwaitingReason{std::move(intent)};
    return replaced;
}

auto RouteController::requestSkip(std::string_view jobId) -> Expected<std::optional<PendingIntent>> {
    if (!indexOf(jobId)) {
        return std::unexpected(no_such_job(jobId));
    }
    return replaceIntent(SkipIntent{std::string{jobId}});
}

auto RouteController::requestMove(std::size_t fromIndex, std::size_t toIndex) -> Expected<std::optional<PendingIntent>> {
    if (fromIndex >= jobs_.size() || toIndex >= jobs_.size()) {
        return std::unexpected(Error{Error::Code::InvalidIndex,
                                     "move " + std::to_string(fromIndex) + "->" + std::to_string(toIndex)
                                         + " outside a route of " + std::to_string(jobs_.size()) + " jobs"});
    }
    return replaceIntent(MoveIntent{jobs_[fromIndex].id, fromIndex, toIndex});
}

auto RouteController::commit(ReasonCode reason) -> Expected<PendingIntent> {
    auto* awaiting = std::get_if<AwaitingReason>(&intent_);
    if (awaiting == nullptr) {
        return std::unexpected(Error{Error::Code::NoPendingIntent, "no skip or move awaiting a reason"});
    }
    auto intent = std::move(awaiting->intent);
    intent_     = Idle{};

    std::string const reasonText{reason_code_text(reason)};
    if (auto const* skip = std::get_if<SkipIntent>(&intent)) {
        auto const index = indexOf(skip->jobId);
        if (!index) {
            return std::unexpected(no_such_job(skip->jobId));
        }
        jobs_[*index].status = JobStatus::Skipped;
        ts_log("Skipped job " + skip->jobId + " (" + reasonText + ")", "Lifecycle");
        record(Sync::ActionKind::Skip, skip->jobId, std::nullopt, std::nullopt, reasonText);
    } else if (auto const* move = std::get_if<MoveIntent>(&intent)) {
        auto job = std::move(jobs_[move->fromIndex]);
        jobs_.erase(jobs_.begin() + static_cast<std::ptrdiff_t>(move->fromIndex));
        jobs_.insert(jobs_.begin() + static_cast<std::ptrdiff_t>(move->toIndex), std::move(job));
        ts_log("Moved job " + move->jobId + " (" + reasonText + ")", "Lifecycle");
        record(Sync::ActionKind::Move,
               move->jobId,
               std::nullopt,
               std::to_string(move->fromIndex) + "->" + std::to_string(move->toIndex),
               reasonText);
    }
    return intent;
}

auto RouteController::cancel() -> std::optional<PendingIntent> {
    auto* awaiting = std::get_if<AwaitingReason>(&intent_);
    if (awaiting == nullptr) {
        return std::nullopt;
    }
    auto intent = std::move(awaiting->intent);
    intent_     = Idle{};
    ts_log("Cancelled " + describe_intent(intent), "Lifecycle");
    return intent;
}

auto RouteController::startRoute() -> Expected<void> {
    if (routeStartTime_) {
        return std::unexpected(Error{Error::Code::InvalidTransition, "route already started"});
    }
    routeStartTime_ = now_();
    record(Sync::ActionKind::RouteStart, std::nullopt, "route_start", format_iso8601(*routeStartTime_));
    return {};
}

auto RouteController::endRoute() -> Expected<void> {
    if (!routeStartTime_) {
        return std::unexpected(Error{Error::Code::InvalidTransition, "route not started"});
    }
    routeStartTime_.reset();
    record(Sync::ActionKind::RouteEnd, std::nullopt, "route_end", format_iso8601(now_()));
    return {};
}

auto RouteController::completedJobsCount() const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(jobs_.begin(), jobs_.end(), [](Job const& job) { return job.status == JobStatus::Completed; }));
}

auto RouteController::remainingJobsCount() const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](Job const& job) {
        return job.status == JobStatus::Pending || job.status == JobStatus::InProgress;
    }));
}

auto RouteController::completionFraction() const -> double {
    if (jobs_.empty()) {
        return 0.0;
    }
    return static_cast<double>(completedJobsCount()) / static_cast<double>(jobs_.size());
}

void RouteController::record(Sync::ActionKind kind,
                             std::optional<std::string> jobId,
                             std::optional<std::string> key,
                             std::optional<std::string> value,
                             std::optional<std::string> reason) {
    [[maybe_unused]] auto const queued = journal_.record(Sync::PendingAction{.kind      = kind,
                                                                             .entityId  = std::move(jobId),
                                                                             .key       = std::move(key),
                                                                             .value     = std::move(value),
                                                                             .reason    = std::move(reason),
                                                                             .timestamp = now_()});
    ts_log("Recorded " + std::string{Sync::action_kind_name(kind)} + (queued ? " (queued)" : " (online)"), "Lifecycle");
}

} // namespace TS::Route
