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
    /**
     * Graph command - builds the dependency graph of a directory tree and
     * renders it.
     */
    class GraphCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "graph";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Build the dependency graph of a project tree and export it";
        }

        [[nodiscard]] std::string_view positional_usage() const noexcept override {
            return "<dir>";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: pinch graph <dir> [OPTIONS]\n"
                   "\n"
                   "Scans <dir> for Package.resolved and *.deps.json files, merges\n"
                   "them into one graph and prints it.\n"
                   "\n"
                   "Examples:\n"
                   "  pinch graph ~/src/ios-app\n"
                   "  pinch graph . --format dot --output deps.dot\n"
                   "  pinch graph . --show-targets --augment --hide-transient";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = graph_arguments();
            args.push_back({"format", 'f', "Output format: json, dot, stats, tree", false, true, "stats", "FORMAT"});
            args.push_back({"output", 'o', "Write to a file instead of stdout", false, true, "", "FILE"});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Usage: pinch graph <dir>";
            }
            if (!exporters::parse_export_format(args.get_or("format", "stats"))) {
                return "Unknown format: " + args.get_or("format", "") + " (expected json, dot, stats or tree)";
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

            auto format = *exporters::parse_export_format(args.get_or("format", "stats"));
            if (is_json()) {
                format = exporters::ExportFormat::JSON;
            }

            const fs::path root = args.positional()[0];
            print_verbose("Scanning " + root.string());

            auto loaded = load_graph(root, std::move(options).value(), nullptr);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return kExitError;
            }
            const auto& [scan, report] = loaded.value();

            for (const auto& skipped : scan.skipped) {
                print_warning(skipped);
            }
            if (scan.empty()) {
                print("No dependency records found in " + root.string());
                return kExitSuccess;
            }
            for (const auto& warning : report.warnings) {
                print_warning(warning);
            }

            print_verbose("Parsed " + std::to_string(scan.records.size()) + " records from " +
                          std::to_string(scan.files.size()) + " files");
            print_debug("Nodes: " + std::to_string(report.graph.node_count()) +
                        ", edges: " + std::to_string(report.graph.edge_count()));
            if (report.graph.flags().augment) {
                print_verbose("Resolved " + std::to_string(report.roots_resolved) + " package roots, " +
                              std::to_string(report.augmentation_failures) + " failed");
            }

            const auto exporter = exporters::ExporterFactory::create(format);
            const exporters::ExportOptions export_options;

            if (const auto output = args.get("output"); output && !output->empty()) {
                if (auto written = exporter->export_to_file(*output, report.graph, export_options); written.is_err()) {
                    print_error(written.error().to_string());
                    return kExitError;
                }
                print("Wrote " + std::string(exporters::to_string(format)) + " graph to " + *output);
                return kExitSuccess;
            }

            if (auto written = exporter->export_to_stream(std::cout, report.graph, export_options); written.is_err()) {
                print_error(written.error().to_string());
                return kExitError;
            }
            return kExitSuccess;
        }
    };

    namespace {
        struct GraphCommandRegistrar {
            GraphCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<GraphCommand>()
                );
            }
        } graph_registrar;
    }
}  // namespace pinch::cli
