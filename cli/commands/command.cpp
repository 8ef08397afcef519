//
// Created by gregorian-rayne on 2/9/26.
//

#include "pinch/cli/commands/command.hpp"
#include "pinch/cli/formatter.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pinch::cli
{
    namespace {

        struct CommonFlag {
            const char* name;
            char short_name;
            const char* description;
        };

        constexpr std::array<CommonFlag, 6> kCommonFlags = {{
            {"help",     'h', "Show this help message"},
            {"verbose",  'v', "Report skipped files and warnings in detail"},
            {"quiet",    'q', "Only show errors"},
            {"debug",    0,   "Also print resolver and timing details"},
            {"json",     0,   "Output in JSON format"},
            {"no-color", 0,   "Disable colored output"},
        }};

        const CommonFlag* find_common(const std::string_view name) {
            const auto it = std::ranges::find_if(kCommonFlags, [&](const CommonFlag& f) {
                return name == f.name;
            });
            return it == kCommonFlags.end() ? nullptr : &*it;
        }

        const CommonFlag* find_common(const char short_name) {
            const auto it = std::ranges::find_if(kCommonFlags, [&](const CommonFlag& f) {
                return f.short_name != 0 && f.short_name == short_name;
            });
            return it == kCommonFlags.end() ? nullptr : &*it;
        }

        template<typename T>
        std::optional<T> parse_number(const std::string& text) {
            T value{};
            const char* end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return value;
        }

        void print_option(std::ostream& out, const char short_name, const std::string& name,
                          const std::string& text) {
            out << "  " << (short_name ? std::string("-") + short_name + ", " : std::string("    "))
                << "--" << std::left << std::setw(20) << name << text << "\n";
        }

        /**
         * Walks argv once; stops at the first problem.
         */
        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args), defs_(defs) {}

            ParseResult run() {
                for (const auto& def : defs_) {
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }

                bool options_ended = false;
                for (index_ = 0; index_ < args_.size() && result_.success; ++index_) {
                    const std::string& arg = args_[index_];
                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg[0] != '-' || arg == "-") {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        long_option(arg.substr(2));
                    } else {
                        short_cluster(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const ArgDef* find(const std::string_view name) const {
                const auto it = std::ranges::find_if(defs_, [&](const ArgDef& d) { return d.name == name; });
                return it == defs_.end() ? nullptr : &*it;
            }

            const ArgDef* find(const char short_name) const {
                const auto it = std::ranges::find_if(defs_, [&](const ArgDef& d) {
                    return d.short_name != 0 && d.short_name == short_name;
                });
                return it == defs_.end() ? nullptr : &*it;
            }

            std::optional<std::string> next_value() {
                if (index_ + 1 < args_.size()) {
                    return args_[++index_];
                }
                return std::nullopt;
            }

            void long_option(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const ArgDef* def = find(std::string_view(name));
                if (!def) {
                    if (find_common(std::string_view(name))) {
                        result_.args.set_flag(name);
                    } else {
                        fail("Unknown option: --" + name);
                    }
                    return;
                }
                if (!def->takes_value) {
                    result_.args.set_flag(def->name);
                    return;
                }

                auto value = inline_value ? inline_value : next_value();
                if (!value || value->empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(def->name, *value);
            }

            void short_cluster(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];
                    const ArgDef* def = find(c);
                    if (!def) {
                        if (const auto* common = find_common(c)) {
                            result_.args.set_flag(common->name);
                        } else {
                            fail(std::string("Unknown option: -") + c);
                            return;
                        }
                        continue;
                    }
                    if (!def->takes_value) {
                        result_.args.set_flag(def->name);
                        continue;
                    }

                    // The rest of the cluster is the value.
                    auto value = j + 1 < arg.size() ? std::optional(arg.substr(j + 1)) : next_value();
                    if (!value || value->empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                        return;
                    }
                    result_.args.set(def->name, *value);
                    return;
                }
            }

            const std::vector<std::string>& args_;
            const std::vector<ArgDef>& defs_;
            std::size_t index_ = 0;
            ParseResult result_;
        };

    }  // namespace

    // ============================================================================
    // ParsedArgs
    // ============================================================================

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? std::nullopt : std::optional(it->second);
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& fallback) const {
        return get(name).value_or(fallback);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto text = get(name);
        return text ? parse_number<int>(*text) : std::nullopt;
    }

    std::optional<double> ParsedArgs::get_double(const std::string& name) const {
        const auto text = get(name);
        return text ? parse_number<double>(*text) : std::nullopt;
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: pinch " << name();
        if (const auto positional = positional_usage(); !positional.empty()) {
            ss << " " << positional;
        }
        for (const auto& arg : arguments()) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }
        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                std::string text = arg.description;
                if (!arg.default_value.empty()) {
                    text += " (default: " + arg.default_value + ")";
                }
                if (arg.required) {
                    text += " [required]";
                }
                print_option(std::cout, arg.short_name, arg.name, text);
            }
            std::cout << "\n";
        }

        std::cout << "Common options:\n";
        for (const auto& flag : kCommonFlags) {
            print_option(std::cout, flag.short_name, flag.name, flag.description);
        }
    }

    void Command::apply_common_flags(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            verbosity_ = Verbosity::Debug;
        } else if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
        if (args.get_flag("json")) {
            output_format_ = OutputFormat::JSON;
        }
        if (args.get_flag("no-color")) {
            colors::set_enabled(false);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (is_verbose()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Debug) {
            std::cout << "[DEBUG] " << msg << "\n";
        }
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::ranges::find_if(commands_, [&](const auto& cmd) { return cmd->name() == name; });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    ParseResult parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        return ArgumentParser(args, defs).run();
    }
}  // namespace pinch::cli
