#pragma once

#include <techscreen/sync/SyncCoordinator.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TS::Tools {

struct InspectOptions {
    std::string                                      screen_path;
    std::string                                      jobs_path;
    // Job whose fields bind the root of the screen; empty renders without one.
    std::string                                      job_id;
    std::string                                      output_path;
    std::vector<std::pair<std::string, std::string>> text_values;
    int                                              indent{2};
    bool                                             offline{false};
    bool                                             validate_only{false};
    bool                                             show_help{false};
    std::string                                      log_tags;
    Sync::SyncPolicy                                 sync{};
};

// Environment first, then flags; returns nullopt after printing the problem.
auto ParseInspectArguments(int argc, char const* const* argv) -> std::optional<InspectOptions>;

void PrintInspectUsage();

bool ApplyInspectEnvOverrides(InspectOptions& options);

auto ValidateInspectOptions(InspectOptions const& options) -> std::optional<std::string>;

[[nodiscard]] auto parse_compaction_mode(std::string_view text) -> std::optional<Sync::CompactionMode>;
[[nodiscard]] auto compaction_mode_name(Sync::CompactionMode mode) -> std::string_view;

} // namespace TS::Tools
