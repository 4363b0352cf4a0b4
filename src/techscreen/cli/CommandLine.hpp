#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TS::CLI {

class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void set_program_name(std::string_view name);
    void set_summary(std::string_view summary);
    void set_positional_handler(std::function<ParseError(std::string_view)> handler);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
        std::string            help;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
        std::string                                 help;
        std::string                                 value_name = "VALUE";
    };

    struct IntOption {
        std::function<void(int)> on_value;
        std::string              help;
        std::optional<int>       min_value;
    };

    struct DoubleOption {
        std::function<void(double)> on_value;
        std::string                 help;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_double(std::string_view name, DoubleOption option);
    void add_alias(std::string_view alias, std::string_view target);

    // Accepts `--name value` and `--name=value`. Tokens not starting with '-'
    // go to the positional handler; unknown options are errors.
    [[nodiscard]] bool parse(int argc, char const* const* argv);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct OptionEntry {
        std::string                                 name;
        std::string                                 help;
        std::string                                 value_name;
        std::vector<std::string>                    aliases;
        bool                                        expects_value = false;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void register_option(OptionEntry entry);
    void log_error(std::string_view message);
    bool looks_like_option(std::string_view token) const;
    void mark_error();

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::string                                  program_name_;
    std::string                                  summary_;
    std::function<ParseError(std::string_view)>  positional_handler_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
};

} // namespace TS::CLI
