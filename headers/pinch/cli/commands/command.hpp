//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef PINCH_COMMAND_HPP
#define PINCH_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand interface, registry and argument parser.
 *
 * Every subcommand (graph, analyze, diff) derives from Command and
 * registers itself with CommandRegistry from a static registrar in its
 * own translation unit. main() only dispatches.
 *
 * Diagnostics follow one convention: results go to stdout, "error:" and
 * "warning:" lines go to stderr, and --quiet silences everything except
 * errors.
 */

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pinch::cli
{
    inline constexpr int kExitSuccess = 0;
    inline constexpr int kExitError = 1;
    inline constexpr int kExitUsage = 2;

    /**
     * One --long option (with optional -s alias) a command accepts.
     */
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool required = false;
        bool takes_value = true;           // false for boolean switches
        std::string default_value;         // pre-seeded before parsing when non-empty
        std::string value_name = "VALUE";
    };

    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value) { values_[name] = value; }
        void set_flag(const std::string& name) { flags_.insert(name); }
        void add_positional(const std::string& value) { positional_.push_back(value); }

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& fallback) const;

        /**
         * Whole-string numeric conversion; trailing junk or overflow
         * yields nullopt.
         */
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] std::optional<double> get_double(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const { return flags_.contains(name); }
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::map<std::string, std::string> values_;
        std::set<std::string> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose,
        Debug
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Positional part of the usage line, e.g. "<dir>".
         */
        [[nodiscard]] virtual std::string_view positional_usage() const noexcept { return ""; }

        [[nodiscard]] virtual std::string usage() const;
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return A usage problem, or an empty string when args are valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        /**
         * Applies -v/-q/--debug, --json and --no-color.
         */
        void apply_common_flags(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the command name.
     *
     * Accepts --name value, --name=value, -n value, -nvalue and clustered
     * short switches. "--" ends option parsing. The common flags (help,
     * verbose, quiet, json, debug, no-color) are accepted by every
     * command.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace pinch::cli

#endif //PINCH_COMMAND_HPP
