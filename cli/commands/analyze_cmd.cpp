//
// Created by gregorian-rayne on 2/9/26.
//

#include "pinch/cli/commands/command.hpp"
#include "pinch/cli/commands/graph_loader.hpp"
#include "pinch/cli/formatter.hpp"

#include "pinch/pinch.hpp"
#include "pinch/exporters/exporter.hpp"
#include "pinch/heuristics/config.hpp"
#include "pinch/utils/string_utils.hpp"

#include <array>
#include <optional>
#include <iostream>

namespace pinch::cli
{
    namespace {

        /**
         * Applies --critical/--high/--medium/--depth-weight/--top on top of
         * the loaded configuration.
         */
        Result<heuristics::PinchConfig, Error> config_from(const ParsedArgs& args) {
            auto config = heuristics::PinchConfig::defaults();

            if (const auto path = args.get("config"); path && !path->empty()) {
                auto loaded = heuristics::load_config(*path);
                if (loaded.is_err()) {
                    return loaded;
                }
                config = std::move(loaded).value();
            }

            const auto count_option = [&](const std::string& option, std::size_t& target) -> std::optional<Error> {
                if (!args.has(option)) {
                    return std::nullopt;
                }
                const auto value = args.get_int(option);
                if (!value || *value < 0) {
                    return Error::invalid_argument("--" + option + " must be a non-negative integer");
                }
                target = static_cast<std::size_t>(*value);
                return std::nullopt;
            };

            const std::array<std::pair<const char*, std::size_t*>, 4> overrides{{
                {"critical", &config.risk.critical},
                {"high", &config.risk.high},
                {"medium", &config.risk.medium},
                {"top", &config.report.top_n}
            }};
            for (const auto& [option, target] : overrides) {
                if (auto error = count_option(option, *target)) {
                    return Result<heuristics::PinchConfig, Error>::failure(*error);
                }
            }

            if (args.has("depth-weight")) {
                const auto weight = args.get_double("depth-weight");
                if (!weight) {
                    return Result<heuristics::PinchConfig, Error>::failure(
                        Error::invalid_argument("--depth-weight must be a number")
                    );
                }
                config.scoring.depth_weight = *weight;
            }

            if (auto valid = heuristics::validate(config); valid.is_err()) {
                return Result<heuristics::PinchConfig, Error>::failure(valid.error());
            }
            return Result<heuristics::PinchConfig, Error>::success(config);
        }

        std::string dependents_cell(const analysis::PinchPointInfo& point) {
            return std::to_string(point.direct_dependents) + "/" + std::to_string(point.transitive_dependents);
        }

        std::string dependencies_cell(const analysis::PinchPointInfo& point) {
            return std::to_string(point.direct_dependencies) + "/" + std::to_string(point.transitive_dependencies);
        }

    }  // namespace

    /**
     * Analyze command - ranks the pinch points of a project tree.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find the modules whose change forces the widest rebuild";
        }

        [[nodiscard]] std::string_view positional_usage() const noexcept override {
            return "<dir>";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: pinch analyze <dir> [OPTIONS]\n"
                   "\n"
                   "Builds the dependency graph of <dir>, collapses dependency cycles\n"
                   "and scores every module by how much of the graph depends on it.\n"
                   "\n"
                   "Risk tiers are assigned by transitive dependents:\n"
                   "  Critical >= 20, High >= 10, Medium >= 5 (override with --critical,\n"
                   "  --high, --medium or a --config file)\n"
                   "\n"
                   "Examples:\n"
                   "  pinch analyze .\n"
                   "  pinch analyze . --internal-only --top 20\n"
                   "  pinch analyze . --config pinch.json --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            auto args = graph_arguments();
            args.push_back({"internal-only", 'i', "Only score containers, targets and internal modules", false, false, "", ""});
            args.push_back({"top", 'n', "Number of pinch points to show", false, true, "", "N"});
            args.push_back({"critical", 0, "Transitive dependents for Critical risk", false, true, "", "N"});
            args.push_back({"high", 0, "Transitive dependents for High risk", false, true, "", "N"});
            args.push_back({"medium", 0, "Transitive dependents for Medium risk", false, true, "", "N"});
            args.push_back({"depth-weight", 0, "Impact weight per level of depth", false, true, "", "X"});
            args.push_back({"config", 'c', "JSON configuration file", false, true, "", "FILE"});
            args.push_back({"json", 0, "Output in JSON format", false, false, "", ""});
            return args;
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Usage: pinch analyze <dir>";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return kExitSuccess;
            }
            apply_common_flags(args);

            auto config = config_from(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return config.error().code() == ErrorCode::InvalidArgument ? kExitUsage : kExitError;
            }
            auto options = build_options_from(args);
            if (options.is_err()) {
                print_error(options.error().message());
                return kExitUsage;
            }

            const fs::path root = args.positional()[0];
            auto loaded = load_graph(root, std::move(options).value(), nullptr);
            if (loaded.is_err()) {
                print_error(loaded.error().to_string());
                return kExitError;
            }
            const auto& [scan, build] = loaded.value();

            for (const auto& skipped : scan.skipped) {
                print_warning(skipped);
            }
            if (scan.empty()) {
                print("No dependency records found in " + root.string());
                return kExitSuccess;
            }
            for (const auto& warning : build.warnings) {
                print_warning(warning);
            }

            const auto report = analysis::analyze(build.graph, args.get_flag("internal-only"), config.value());

            if (is_json()) {
                auto output = exporters::analysis_to_json(report, config.value());
                output["schemaVersion"] = build.graph.schema_version();
                std::cout << output.dump(2) << "\n";
                return kExitSuccess;
            }

            print_report(build.graph, report, config.value());
            return kExitSuccess;
        }

    private:
        void print_report(const graph::Graph& graph,
                          const analysis::PinchPointReport& report,
                          const heuristics::PinchConfig& config) const {
            if (is_quiet()) {
                return;
            }

            const auto summary = analysis::summarize(report);
            std::cout << "\n" << bold("Pinch Point Analysis") << "\n";
            std::cout << "  Nodes:      " << format_count(graph.node_count())
                      << " (" << format_count(report.points.size()) << " scored)\n";
            std::cout << "  Edges:      " << format_count(graph.edge_count()) << "\n";
            std::cout << "  Max depth:  " << report.max_depth << "\n";
            std::cout << "  Risk:       "
                      << colorize_risk(heuristics::RiskLevel::Critical) << " " << summary.critical << "  "
                      << colorize_risk(heuristics::RiskLevel::High) << " " << summary.high << "  "
                      << colorize_risk(heuristics::RiskLevel::Medium) << " " << summary.medium << "  "
                      << colorize_risk(heuristics::RiskLevel::Low) << " " << summary.low << "\n";

            const auto top = analysis::top_by_impact(report, config.report.top_n);
            if (!top.empty()) {
                const double max_impact = top.front().impact_score;

                std::cout << "\n" << bold("Top Pinch Points (by impact)") << "\n\n";
                Table table({
                    {"#", 3, true},
                    {"Module", 32, false},
                    {"Kind", 9, false},
                    {"Risk", 8, false},
                    {"Dependents", 10, true},
                    {"Depth", 5, true},
                    {"Cycle", 5, true},
                    {"Impact", 8, true},
                    {"", 0, false}
                });
                std::size_t rank = 1;
                for (const auto& point : top) {
                    table.add_row({
                        std::to_string(rank++),
                        point.name,
                        graph::to_string(point.kind),
                        heuristics::to_string(point.risk),
                        dependents_cell(point),
                        std::to_string(point.dependency_depth),
                        std::to_string(point.cycle_size),
                        format_score(point.impact_score),
                        bar_graph(point.impact_score, max_impact, 20)
                    });
                }
                table.render(std::cout);
            }

            const auto vulnerable = analysis::top_by_vulnerability(report, config.report.top_n);
            if (!vulnerable.empty() && vulnerable.front().vulnerability_score > 0.0) {
                std::cout << "\n" << bold("Most Vulnerable (by transitive dependencies)") << "\n\n";
                Table table({
                    {"#", 3, true},
                    {"Module", 32, false},
                    {"Kind", 9, false},
                    {"Dependencies", 12, true},
                    {"Depth", 5, true}
                });
                std::size_t rank = 1;
                for (const auto& point : vulnerable) {
                    table.add_row({
                        std::to_string(rank++),
                        point.name,
                        graph::to_string(point.kind),
                        dependencies_cell(point),
                        std::to_string(point.dependency_depth)
                    });
                }
                table.render(std::cout);
            }

            if (const auto cycles = analysis::find_cycles(report); !cycles.empty()) {
                std::cout << "\n" << bold("Dependency Cycles") << "\n";
                for (const auto& cycle : cycles) {
                    std::cout << "  [" << cycle.size() << "] " << string_utils::join(cycle, ", ") << "\n";
                }
            }

            print_verbose("\nDependents and Dependencies columns show direct/transitive counts.");
            std::cout << "\n";
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace pinch::cli
