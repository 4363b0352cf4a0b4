#include <techscreen/tools/InspectOptions.hpp>

#include "cli/CommandLine.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

namespace TS::Tools {

namespace {

constexpr std::string_view kProgramName = "techscreen_inspect";

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto const* end = text.data() + text.size();
    auto result     = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc{} || result.ptr != end) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

auto parse_assignment(std::string_view text) -> std::optional<std::pair<std::string, std::string>> {
    auto const equals = text.find('=');
    if (equals == std::string_view::npos || equals == 0) {
        return std::nullopt;
    }
    return std::pair<std::string, std::string>{std::string{text.substr(0, equals)}, std::string{text.substr(equals + 1)}};
}

} // namespace

auto parse_compaction_mode(std::string_view text) -> std::optional<Sync::CompactionMode> {
    if (text == "replay-all") {
        return Sync::CompactionMode::ReplayAll;
    }
    if (text == "last-write-wins") {
        return Sync::CompactionMode::LastWriteWins;
    }
    return std::nullopt;
}

auto compaction_mode_name(Sync::CompactionMode mode) -> std::string_view {
    switch (mode) {
    case Sync::CompactionMode::ReplayAll:
        return "replay-all";
    case Sync::CompactionMode::LastWriteWins:
        return "last-write-wins";
    }
    return "replay-all";
}

auto ValidateInspectOptions(InspectOptions const& options) -> std::optional<std::string> {
    if (options.show_help) {
        return std::nullopt;
    }
    if (options.screen_path.empty()) {
        return std::string{"a screen file is required (--screen or positional argument)"};
    }
    if (!options.job_id.empty() && options.jobs_path.empty()) {
        return std::string{"--job requires --jobs"};
    }
    if (options.indent < -1 || options.indent > 8) {
        return std::string{"--indent must be within -1..8"};
    }
    if (options.sync.max_attempts < 1) {
        return std::string{"--sync-max-attempts must be >= 1"};
    }
    if (options.sync.initial_backoff.count() < 0) {
        return std::string{"--sync-backoff-ms must be >= 0"};
    }
    if (options.sync.max_backoff < options.sync.initial_backoff) {
        return std::string{"--sync-max-backoff-ms must be >= --sync-backoff-ms"};
    }
    if (options.sync.backoff_multiplier < 1.0) {
        return std::string{"--sync-multiplier must be >= 1"};
    }
    return std::nullopt;
}

bool ApplyInspectEnvOverrides(InspectOptions& options) {
    if (!apply_env("TECHSCREEN_OFFLINE", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << "TECHSCREEN_OFFLINE must be a boolean\n";
                return false;
            }
            options.offline = *parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_INDENT", [&](std::string_view value) {
            if (!parse_integer(value, options.indent)) {
                std::cerr << "TECHSCREEN_INDENT must be an integer\n";
                return false;
            }
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_LOG_TAGS", [&](std::string_view value) {
            options.log_tags = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_SYNC_MAX_ATTEMPTS", [&](std::string_view value) {
            if (!parse_integer(value, options.sync.max_attempts)) {
                std::cerr << "TECHSCREEN_SYNC_MAX_ATTEMPTS must be an integer\n";
                return false;
            }
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_SYNC_BACKOFF_MS", [&](std::string_view value) {
            std::int64_t parsed = 0;
            if (!parse_integer(value, parsed)) {
                std::cerr << "TECHSCREEN_SYNC_BACKOFF_MS must be an integer\n";
                return false;
            }
            options.sync.initial_backoff = std::chrono::milliseconds{parsed};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_SYNC_MAX_BACKOFF_MS", [&](std::string_view value) {
            std::int64_t parsed = 0;
            if (!parse_integer(value, parsed)) {
                std::cerr << "TECHSCREEN_SYNC_MAX_BACKOFF_MS must be an integer\n";
                return false;
            }
            options.sync.max_backoff = std::chrono::milliseconds{parsed};
            return true;
        })) {
        return false;
    }

    if (!apply_env("TECHSCREEN_SYNC_COMPACTION", [&](std::string_view value) {
            auto mode = parse_compaction_mode(value);
            if (!mode) {
                std::cerr << "TECHSCREEN_SYNC_COMPACTION must be replay-all or last-write-wins\n";
                return false;
            }
            options.sync.compaction = *mode;
            return true;
        })) {
        return false;
    }

    return true;
}

namespace {

void register_options(CLI::CommandLine& cli, InspectOptions& options) {
    cli.set_program_name(kProgramName);
    cli.set_summary("Decodes a screen payload, validates it, resolves it against a route and prints the result as JSON.");
    cli.set_positional_handler([&options](std::string_view token) -> CLI::CommandLine::ParseError {
        if (!options.screen_path.empty()) {
            return std::string{"only one screen file may be given"};
        }
        options.screen_path = std::string{token};
        return std::nullopt;
    });

    cli.add_value("--screen", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                   options.screen_path = std::string{value};
                                   return std::nullopt;
                               },
                               .help       = "Screen payload ({version, component}) to inspect",
                               .value_name = "FILE"});
    cli.add_value("--jobs", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                 options.jobs_path = std::string{value};
                                 return std::nullopt;
                             },
                             .help       = "Route fixture used for bindings and list expansion",
                             .value_name = "FILE"});
    cli.add_value("--job", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                options.job_id = std::string{value};
                                return std::nullopt;
                            },
                            .help       = "Job bound at the screen root",
                            .value_name = "ID"});
    cli.add_value("--output", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                   options.output_path = std::string{value};
                                   return std::nullopt;
                               },
                               .help       = "Write JSON here instead of stdout",
                               .value_name = "FILE"});
    cli.add_value("--set", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                auto assignment = parse_assignment(value);
                                if (!assignment) {
                                    return std::string{"--set expects KEY=VALUE"};
                                }
                                options.text_values.push_back(std::move(*assignment));
                                return std::nullopt;
                            },
                            .help       = "Store a text value before resolving (repeatable)",
                            .value_name = "KEY=VALUE"});
    cli.add_value("--sync-compaction",
                  {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                       auto mode = parse_compaction_mode(value);
                       if (!mode) {
                           return std::string{"--sync-compaction must be replay-all or last-write-wins"};
                       }
                       options.sync.compaction = *mode;
                       return std::nullopt;
                   },
                   .help       = "Drain policy for queued input actions",
                   .value_name = "MODE"});
    cli.add_value("--log-tags", {.on_value = [&options](std::string_view value) -> CLI::CommandLine::ParseError {
                                     options.log_tags = std::string{value};
                                     return std::nullopt;
                                 },
                                 .help       = "Comma separated log tags to enable",
                                 .value_name = "TAGS"});
    cli.add_int("--indent", {.on_value = [&options](int value) { options.indent = value; },
                             .help     = "JSON indentation (-1 for compact)"});
    cli.add_int("--sync-max-attempts", {.on_value  = [&options](int value) { options.sync.max_attempts = value; },
                                        .help      = "Delivery attempts before giving up",
                                        .min_value = 1});
    cli.add_int("--sync-backoff-ms",
                {.on_value  = [&options](int value) { options.sync.initial_backoff = std::chrono::milliseconds{value}; },
                 .help      = "Delay before the first retry",
                 .min_value = 0});
    cli.add_int("--sync-max-backoff-ms",
                {.on_value  = [&options](int value) { options.sync.max_backoff = std::chrono::milliseconds{value}; },
                 .help      = "Upper bound on the retry delay",
                 .min_value = 0});
    cli.add_double("--sync-multiplier", {.on_value = [&options](double value) { options.sync.backoff_multiplier = value; },
                                         .help     = "Growth factor between retries"});
    cli.add_flag("--offline", {.on_set = [&options] { options.offline = true; },
                               .help   = "Start disconnected, queue mutations and report their replay"});
    cli.add_flag("--validate-only", {.on_set = [&options] { options.validate_only = true; },
                                     .help   = "Only report validation issues"});
    cli.add_flag("--help", {.on_set = [&options] { options.show_help = true; }, .help = "Show this message"});
    cli.add_alias("-h", "--help");
    cli.add_alias("-o", "--output");
}

} // namespace

void PrintInspectUsage() {
    InspectOptions   scratch{};
    CLI::CommandLine cli;
    register_options(cli, scratch);
    std::cout << cli.usage()
              << "\nEnvironment: TECHSCREEN_OFFLINE, TECHSCREEN_INDENT, TECHSCREEN_LOG_TAGS, TECHSCREEN_SYNC_MAX_ATTEMPTS,\n"
                 "             TECHSCREEN_SYNC_BACKOFF_MS, TECHSCREEN_SYNC_MAX_BACKOFF_MS, TECHSCREEN_SYNC_COMPACTION\n";
}

auto ParseInspectArguments(int argc, char const* const* argv) -> std::optional<InspectOptions> {
    InspectOptions options{};
    if (!ApplyInspectEnvOverrides(options)) {
        return std::nullopt;
    }

    CLI::CommandLine cli;
    register_options(cli, options);
    if (!cli.parse(argc, argv)) {
        return std::nullopt;
    }

    if (auto error = ValidateInspectOptions(options)) {
        std::cerr << kProgramName << ": " << *error << '\n';
        return std::nullopt;
    }
    return options;
}

} // namespace TS::Tools
