#include <techscreen/log/TaggedLogger.hpp>
#include <techscreen/route/Job.hpp>
#include <techscreen/route/RouteController.hpp>
#include <techscreen/store/InputValueStore.hpp>
#include <techscreen/sync/OfflineActionQueue.hpp>
#include <techscreen/tools/InspectOptions.hpp>
#include <techscreen/tools/SyncReplay.hpp>
#include <techscreen/ui/declarative/Resolver.hpp>
#include <techscreen/ui/declarative/Schema.hpp>
#include <techscreen/ui/declarative/ScreenCodec.hpp>
#include <techscreen/ui/declarative/Validation.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace TS;

auto read_file(std::string const& path) -> std::optional<std::string> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "techscreen_inspect: failed to open '" << path << "'" << std::endl;
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

auto load_jobs(std::string const& path) -> std::optional<std::vector<Route::Job>> {
    if (path.empty()) {
        return std::vector<Route::Job>{};
    }
    auto text = read_file(path);
    if (!text) {
        return std::nullopt;
    }
    auto payload = nlohmann::json::parse(*text, nullptr, false);
    if (payload.is_discarded()) {
        std::cerr << "techscreen_inspect: '" << path << "' is not valid JSON" << std::endl;
        return std::nullopt;
    }
    auto jobs = Route::ParseJobs(payload);
    if (!jobs) {
        std::cerr << "techscreen_inspect: " << describeError(jobs.error()) << std::endl;
        return std::nullopt;
    }
    return std::move(*jobs);
}

auto write_output(std::string const& jsonString, std::string const& output) -> bool {
    if (output.empty()) {
        std::cout << jsonString << std::endl;
        return true;
    }
    std::filesystem::path destination{output};
    if (auto parent = destination.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    std::ofstream stream(destination, std::ios::binary);
    if (!stream.is_open()) {
        std::cerr << "techscreen_inspect: failed to open output file '" << destination.string() << "'" << std::endl;
        return false;
    }
    stream << jsonString;
    if (!stream.good()) {
        std::cerr << "techscreen_inspect: failed to write JSON output" << std::endl;
        return false;
    }
    return true;
}

auto encode_issues(std::vector<UI::Declarative::NodeIssue> const& issues) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (auto const& issue : issues) {
        out.push_back({{"id", issue.id},
                       {"type", std::string{UI::Declarative::kind_name(issue.kind)}},
                       {"error", describeError(issue.error)}});
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    auto options = Tools::ParseInspectArguments(argc, argv);
    if (!options) {
        return 1;
    }
    if (options->show_help) {
        Tools::PrintInspectUsage();
        return 0;
    }

#ifdef TS_LOG_DEBUG
    if (!options->log_tags.empty()) {
        logger().setEnabledTags(options->log_tags);
        set_logging_enabled(true);
    }
#endif

    auto text = read_file(options->screen_path);
    if (!text) {
        return 1;
    }
    auto screen = UI::Declarative::ParseScreen(*text);
    if (!screen) {
        std::cerr << "techscreen_inspect: " << describeError(screen.error()) << std::endl;
        return 1;
    }
    auto const issues = UI::Declarative::ValidateTree(screen->root);

    nlohmann::json report{
        {"version", screen->version},
        {"compatibility", std::string{UI::Declarative::compatibility_mode(screen->version)}},
        {"nodes", screen->root.subtreeSize()},
        {"issues", encode_issues(issues)},
    };

    if (!options->validate_only) {
        auto jobs = load_jobs(options->jobs_path);
        if (!jobs) {
            return 1;
        }

        Sync::OfflineActionQueue queue;
        Sync::ActionJournal      journal{queue, !options->offline};
        Store::InputValueStore   store{journal};
        Route::RouteController   route{std::move(*jobs), journal};

        for (auto const& [key, value] : options->text_values) {
            store.setText(key, value);
        }

        Route::Job const* entity = nullptr;
        if (!options->job_id.empty()) {
            entity = route.findJob(options->job_id);
            if (entity == nullptr) {
                std::cerr << "techscreen_inspect: no job with id '" << options->job_id << "'" << std::endl;
                return 1;
            }
        }

        UI::Declarative::BindingContext const context{store, entity, route.jobs()};
        auto const resolved = UI::Declarative::ResolveTree(screen->root, context);

        auto pending = nlohmann::json::array();
        for (auto const& action : queue.snapshot()) {
            pending.push_back(Sync::EncodePendingAction(action));
        }

        report["resolved"]       = UI::Declarative::EncodeResolved(resolved);
        report["store"]          = store.toJson();
        report["pendingActions"] = std::move(pending);
        report["dashboard"]      = {{"completed", route.completedJobsCount()},
                                    {"remaining", route.remainingJobsCount()},
                                    {"completion", route.completionFraction()}};

        if (options->offline) {
            auto replay = Tools::ReplayPendingActions(journal, options->sync);
            if (!replay) {
                std::cerr << "techscreen_inspect: " << describeError(replay.error()) << std::endl;
                return 1;
            }
            report["syncReplay"] = std::move(*replay);
        }
    }

    if (!write_output(report.dump(options->indent), options->output_path)) {
        return 1;
    }
#ifdef TS_LOG_DEBUG
    logger().flush();
#endif
    return options->validate_only && !issues.empty() ? 2 : 0;
}
