//
// Created by gregorian-rayne on 2/5/26.
//

#include "pinch/resolve/package_resolver.hpp"
#include "pinch/resolve/process.hpp"
#include "pinch/utils/json_utils.hpp"
#include "pinch/utils/string_utils.hpp"

#include <stack>

namespace pinch::resolve {

    namespace {

        using json = nlohmann::json;

        Result<ResolvedPackage, Error> read_package(const json& j) {
            if (!j.is_object()) {
                return Result<ResolvedPackage, Error>::failure(
                    Error::parse_error("Resolved package is not an object")
                );
            }

            ResolvedPackage package;
            package.identity = string_utils::to_lower(
                string_utils::trim(json_utils::get_or<std::string>(j, "identity", "")));
            package.name = json_utils::get_or<std::string>(j, "name", "");

            if (package.identity.empty()) {
                package.identity = string_utils::to_lower(string_utils::trim(package.name));
            }
            if (package.name.empty()) {
                package.name = package.identity;
            }
            if (package.identity.empty()) {
                return Result<ResolvedPackage, Error>::failure(
                    Error::parse_error("Resolved package has neither identity nor name")
                );
            }
            return Result<ResolvedPackage, Error>::success(std::move(package));
        }

    }  // namespace

    Result<ResolvedPackage, Error> parse_resolved_package(const std::string_view text) {
        auto parsed = json_utils::parse(text);
        if (parsed.is_err()) {
            return Result<ResolvedPackage, Error>::failure(parsed.error());
        }
        const json& document = parsed.value();

        auto root = read_package(document);
        if (root.is_err()) {
            return root;
        }
        ResolvedPackage result = std::move(root).value();

        // Package trees can be deep; walk them with an explicit stack.
        struct Frame {
            const json* source;
            ResolvedPackage* target;
        };
        std::stack<Frame> pending;
        pending.push({&document, &result});

        while (!pending.empty()) {
            const auto [source, target] = pending.top();
            pending.pop();

            const auto it = source->find("dependencies");
            if (it == source->end() || !it->is_array()) {
                continue;
            }

            target->dependencies.reserve(it->size());
            for (const auto& child : *it) {
                auto package = read_package(child);
                if (package.is_err()) {
                    return package;
                }
                target->dependencies.push_back(std::move(package).value());
            }
            for (std::size_t i = 0; i < it->size(); ++i) {
                pending.push({&(*it)[i], &target->dependencies[i]});
            }
        }

        return Result<ResolvedPackage, Error>::success(std::move(result));
    }

    Result<ResolvedPackage, Error> CommandPackageResolver::resolve(const ResolutionRoot& root) const {
        const auto run = process::run_command(command_, root.directory);
        if (run.is_err()) {
            return Result<ResolvedPackage, Error>::failure(
                Error::resolution_error(run.error().message(), root.directory.string())
            );
        }

        const auto& output = run.value();
        if (output.exit_code != 0) {
            std::string message = "Resolution command exited with code " + std::to_string(output.exit_code);
            if (const auto detail = string_utils::trim(output.stderr_output); !detail.empty()) {
                message += ": ";
                message += detail;
            }
            return Result<ResolvedPackage, Error>::failure(
                Error::resolution_error(std::move(message), root.directory.string())
            );
        }

        auto package = parse_resolved_package(output.stdout_output);
        if (package.is_err()) {
            return Result<ResolvedPackage, Error>::failure(
                Error::resolution_error("Malformed resolution output: " + package.error().message(),
                                        root.directory.string())
            );
        }
        return package;
    }

}  // namespace pinch::resolve
