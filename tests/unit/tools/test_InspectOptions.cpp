#include <doctest/doctest.h>

#include <techscreen/tools/InspectOptions.hpp>

#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

using namespace TS::Tools;
using namespace std::chrono_literals;

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

// Clears every variable the tool reads so ambient settings cannot leak in.
struct CleanEnv {
    EnvGuard offline{"TECHSCREEN_OFFLINE", nullptr};
    EnvGuard indent{"TECHSCREEN_INDENT", nullptr};
    EnvGuard tags{"TECHSCREEN_LOG_TAGS", nullptr};
    EnvGuard attempts{"TECHSCREEN_SYNC_MAX_ATTEMPTS", nullptr};
    EnvGuard backoff{"TECHSCREEN_SYNC_BACKOFF_MS", nullptr};
    EnvGuard maxBackoff{"TECHSCREEN_SYNC_MAX_BACKOFF_MS", nullptr};
    EnvGuard compaction{"TECHSCREEN_SYNC_COMPACTION", nullptr};
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

} // namespace

TEST_SUITE("techscreen.tools.inspect_options") {

TEST_CASE("compaction modes parse by name") {
    CHECK(parse_compaction_mode("replay-all") == TS::Sync::CompactionMode::ReplayAll);
    CHECK(parse_compaction_mode("last-write-wins") == TS::Sync::CompactionMode::LastWriteWins);
    CHECK_FALSE(parse_compaction_mode("newest").has_value());
    CHECK(compaction_mode_name(TS::Sync::CompactionMode::LastWriteWins) == "last-write-wins");
}

TEST_CASE("validation detects invalid combinations") {
    InspectOptions options{};
    auto error = ValidateInspectOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("screen") != std::string::npos);

    options.screen_path = "screen.json";
    CHECK_FALSE(ValidateInspectOptions(options).has_value());

    options.job_id = "A";
    error          = ValidateInspectOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--job requires --jobs") != std::string::npos);
    options.jobs_path = "jobs.json";

    options.indent = 9;
    error          = ValidateInspectOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--indent") != std::string::npos);
    options.indent = -1;

    options.sync.initial_backoff = 2000ms;
    options.sync.max_backoff     = 1000ms;
    error                        = ValidateInspectOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--sync-max-backoff-ms") != std::string::npos);
    options.sync.max_backoff = 2000ms;

    options.sync.backoff_multiplier = 0.5;
    error                           = ValidateInspectOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--sync-multiplier") != std::string::npos);
    options.sync.backoff_multiplier = 1.0;

    CHECK_FALSE(ValidateInspectOptions(options).has_value());

    InspectOptions help{};
    help.show_help = true;
    CHECK_FALSE(ValidateInspectOptions(help).has_value());
}

TEST_CASE("flags fill the options") {
    CleanEnv    env;
    ArgvBuilder args{"techscreen_inspect",
                     "screen.json",
                     "--jobs",
                     "route.json",
                     "--job=B",
                     "-o",
                     "out.json",
                     "--set",
                     "eta=5pm",
                     "--set=notes_global=Ant issue",
                     "--offline",
                     "--indent",
                     "-1",
                     "--sync-max-attempts",
                     "3",
                     "--sync-backoff-ms",
                     "250",
                     "--sync-max-backoff-ms",
                     "4000",
                     "--sync-multiplier",
                     "1.5",
                     "--sync-compaction",
                     "last-write-wins"};
    auto options = ParseInspectArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->screen_path == "screen.json");
    CHECK(options->jobs_path == "route.json");
    CHECK(options->job_id == "B");
    CHECK(options->output_path == "out.json");
    REQUIRE(options->text_values.size() == 2);
    CHECK(options->text_values[0] == std::pair<std::string, std::string>{"eta", "5pm"});
    CHECK(options->text_values[1] == std::pair<std::string, std::string>{"notes_global", "Ant issue"});
    CHECK(options->offline);
    CHECK(options->indent == -1);
    CHECK(options->sync.max_attempts == 3);
    CHECK(options->sync.initial_backoff == 250ms);
    CHECK(options->sync.max_backoff == 4000ms);
    CHECK(options->sync.backoff_multiplier == doctest::Approx(1.5));
    CHECK(options->sync.compaction == TS::Sync::CompactionMode::LastWriteWins);
}

TEST_CASE("bad arguments are rejected") {
    CleanEnv env;
    SUBCASE("missing screen") {
        ArgvBuilder args{"techscreen_inspect", "--offline"};
        CHECK_FALSE(ParseInspectArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("malformed assignment") {
        ArgvBuilder args{"techscreen_inspect", "screen.json", "--set", "novalue"};
        CHECK_FALSE(ParseInspectArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("two screens") {
        ArgvBuilder args{"techscreen_inspect", "a.json", "b.json"};
        CHECK_FALSE(ParseInspectArguments(args.argc(), args.argv()).has_value());
    }
    SUBCASE("zero attempts") {
        ArgvBuilder args{"techscreen_inspect", "screen.json", "--sync-max-attempts", "0"};
        CHECK_FALSE(ParseInspectArguments(args.argc(), args.argv()).has_value());
    }
}

TEST_CASE("help needs no screen") {
    CleanEnv    env;
    ArgvBuilder args{"techscreen_inspect", "--help"};
    auto options = ParseInspectArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->show_help);
}

TEST_CASE("environment overrides apply before flags") {
    CleanEnv env;
    EnvGuard offline{"TECHSCREEN_OFFLINE", "yes"};
    EnvGuard indent{"TECHSCREEN_INDENT", "4"};
    EnvGuard tags{"TECHSCREEN_LOG_TAGS", "Sync,Queue"};
    EnvGuard attempts{"TECHSCREEN_SYNC_MAX_ATTEMPTS", "7"};
    EnvGuard compaction{"TECHSCREEN_SYNC_COMPACTION", "last-write-wins"};

    ArgvBuilder args{"techscreen_inspect", "screen.json", "--indent", "0"};
    auto options = ParseInspectArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->offline);
    CHECK(options->indent == 0);
    CHECK(options->log_tags == "Sync,Queue");
    CHECK(options->sync.max_attempts == 7);
    CHECK(options->sync.compaction == TS::Sync::CompactionMode::LastWriteWins);
}

TEST_CASE("malformed environment values fail the parse") {
    CleanEnv env;
    SUBCASE("boolean") {
        EnvGuard offline{"TECHSCREEN_OFFLINE", "sometimes"};
        InspectOptions options{};
        CHECK_FALSE(ApplyInspectEnvOverrides(options));
    }
    SUBCASE("integer") {
        EnvGuard backoff{"TECHSCREEN_SYNC_BACKOFF_MS", "fast"};
        InspectOptions options{};
        CHECK_FALSE(ApplyInspectEnvOverrides(options));
    }
    SUBCASE("compaction") {
        EnvGuard compaction{"TECHSCREEN_SYNC_COMPACTION", "oldest"};
        ArgvBuilder args{"techscreen_inspect", "screen.json"};
        CHECK_FALSE(ParseInspectArguments(args.argc(), args.argv()).has_value());
    }
}

} // TEST_SUITE
