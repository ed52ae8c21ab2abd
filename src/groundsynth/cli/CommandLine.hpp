#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace GS::Cli {

/**
 * Option parser for the groundsynth tools.
 *
 * Options are registered with a callback each; `--name value` and
 * `--name=value` are both accepted. Tokens that are not options are collected
 * as positionals in order. Errors go to the error logger (stderr by default)
 * and make parse() return false.
 */
class CommandLine {
public:
    using ParseError = std::optional<std::string>;

    CommandLine();

    void set_program_name(std::string_view name);
    void set_error_logger(std::function<void(std::string const&)> logger);

    struct FlagOption {
        std::function<void()> on_set;
    };

    struct ValueOption {
        std::function<ParseError(std::string_view)> on_value;
    };

    struct IntOption {
        std::function<ParseError(long long)> on_value;
    };

    struct DoubleOption {
        std::function<ParseError(double)> on_value;
    };

    void add_flag(std::string_view name, FlagOption option);
    void add_value(std::string_view name, ValueOption option);
    void add_int(std::string_view name, IntOption option);
    void add_double(std::string_view name, DoubleOption option);
    void add_alias(std::string_view alias, std::string_view target);

    // Parses argv[first..argc).
    [[nodiscard]] bool parse(int argc, char const* const* argv, int first = 1);
    [[nodiscard]] bool had_errors() const;
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return positionals_; }

private:
    struct OptionEntry {
        std::string                                 name;
        bool                                        expects_value = false;
        std::function<void()>                       flag_handler;
        std::function<ParseError(std::string_view)> value_handler;
    };

    OptionEntry* find_option(std::string_view name);
    void         register_option(OptionEntry entry);
    void         log_error(std::string_view message);
    bool         looks_like_option(std::string_view token) const;
    void         mark_error();

    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<std::string>                     positionals_;
    std::string                                  program_name_;
    std::function<void(std::string const&)>      error_logger_;
    bool                                         had_error_ = false;
};

} // namespace GS::Cli
