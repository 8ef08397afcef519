//
// Created by gregorian-rayne on 2/9/26.
//

#include "pinch/cli/commands/command.hpp"
#include "pinch/cli/commands/graph_loader.hpp"
#include "pinch/cli/formatter.hpp"

#include "pinch/pinch.hpp"
#include "pinch/exporters/exporter.hpp"

#include <iostream>

namespace pinch::cli
{
    namespace {

        std::string colored(const char* color, const std::string& text) {
            if (colors::enabled()) {
                return std::string(color) + text + colors::RESET;
            }
            return text;
        }

        void print_section(const std::string& title, const std::vector<std::string>& items,
                           const char* marker, const char* color) {
            if (items.empty()) {
                return;
            }
            std::cout << "\n" << bold(title) << " (" << items.size() << ")\n";
            for (const auto& item : items) {
                std::cout << "  " << colored(color, std::string(marker) + " " + item) << "\n";
            }
        }

    }  // namespace

    /**
     * Diff command - compares the graphs of two project trees built with
     * the same construction flags.
     */
    class DiffCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "diff";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Compare the dependency graphs of two project trees";
        }

        [[nodiscard]] std::string_view positional_usage() const noexcept override {
            return "<from-dir> <to-dir>";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: pinch diff <from-dir> <to-dir> [OPTIONS]\n"
                   "\n"
                   "Both trees are built with the same flags. Stable ids do not\n"
                   "depend on where a tree is checked out, so two clones of the\n"
                   "same revision diff clean.\n"
                   "\n"
                   "Examples:\n"
                   "  pinch diff ../app-main ../app-feature\n"
                   "  pinch diff before/ after/ --show-targets --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = graph_arguments();
            args.push_back({"json", 0, "Output in JSON format", false, false, "", ""});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 2) {
                return "Usage: pinch diff <from-dir> <to-dir>";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return kExitSuccess;
            }
            apply_common_flags(args);

            auto options = build_options_from(args);
            if (options.is_err()) {
                print_error(options.error().message());
                return kExitUsage;
            }

            const fs::path from_root = args.positional()[0];
            const fs::path to_root = args.positional()[1];

            auto loaded = load_graph_pair(from_root, to_root, options.value());
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return kExitError;
            }
            const auto& pair = loaded.value();

            for (const auto* side : {&pair.from, &pair.to}) {
                for (const auto& skipped : side->scan.skipped) {
                    print_warning(skipped);
                }
                for (const auto& warning : side->report.warnings) {
                    print_warning(warning);
                }
            }

            if (pair.from.scan.empty() && pair.to.scan.empty()) {
                print("No dependency records found in " + from_root.string() + " or " + to_root.string());
                return kExitSuccess;
            }

            const auto& from_graph = pair.from.report.graph;
            const auto& to_graph = pair.to.report.graph;
            if (!analysis::same_construction(from_graph, to_graph)) {
                print_error("Graphs were built with different flags; the diff would be meaningless");
                return kExitError;
            }

            const auto changes = analysis::diff(from_graph, to_graph);
            print_debug("Resolver invocations: " + std::to_string(pair.resolver_invocations));

            if (is_json()) {
                std::cout << exporters::diff_to_json(changes, from_graph.flags()).dump(2) << "\n";
                return kExitSuccess;
            }

            if (changes.empty()) {
                print("No differences.");
                return kExitSuccess;
            }
            if (is_quiet()) {
                return kExitSuccess;
            }

            print_section("Added nodes", changes.added_nodes, "+", colors::GREEN);
            print_section("Removed nodes", changes.removed_nodes, "-", colors::RED);
            print_section("Added edges", changes.added_edges, "+", colors::GREEN);
            print_section("Removed edges", changes.removed_edges, "-", colors::RED);
            std::cout << "\n";
            return kExitSuccess;
        }
    };

    namespace {
        struct DiffCommandRegistrar {
            DiffCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<DiffCommand>()
                );
            }
        } diff_registrar;
    }
}  // namespace pinch::cli
