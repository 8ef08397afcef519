//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef PINCH_PACKAGE_RESOLVER_HPP
#define PINCH_PACKAGE_RESOLVER_HPP

/**
 * @file package_resolver.hpp
 * @brief Package-manager resolution seam.
 *
 * A resolver turns one local package root into the dependency tree the
 * package manager reports for it. The graph builder only talks to the
 * abstract PackageResolver, so tests can substitute a stub.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pinch::resolve {

    /**
     * One node of the resolved dependency tree.
     */
    struct ResolvedPackage {
        std::string identity;   // Package-manager identity, lower case
        std::string name;       // Display name as reported
        std::vector<ResolvedPackage> dependencies;
    };

    /**
     * A package root to resolve.
     */
    struct ResolutionRoot {
        std::string identity;   // Known identity, may be empty
        fs::path directory;     // Working directory for the resolver
    };

    /**
     * Parses the JSON tree emitted by the package manager.
     *
     * Expects objects of the form {"identity", "name", "dependencies": [...]}.
     * A missing identity falls back to the name and vice versa; a node
     * with neither is a ParseError.
     */
    [[nodiscard]] Result<ResolvedPackage, Error> parse_resolved_package(std::string_view text);

    class PackageResolver {
    public:
        virtual ~PackageResolver() = default;

        [[nodiscard]] virtual std::string name() const = 0;

        /**
         * Resolves the dependency tree of a root.
         *
         * Implementations must be safe to call from several threads for
         * different roots.
         */
        [[nodiscard]] virtual Result<ResolvedPackage, Error> resolve(const ResolutionRoot& root) const = 0;
    };

    /**
     * Runs an external command in the root directory and parses its
     * standard output.
     */
    class CommandPackageResolver final : public PackageResolver {
    public:
        static constexpr const char* kDefaultCommand = "swift package show-dependencies --format json";

        explicit CommandPackageResolver(std::string command = kDefaultCommand)
            : command_(std::move(command)) {}

        [[nodiscard]] std::string name() const override { return "command"; }

        [[nodiscard]] Result<ResolvedPackage, Error> resolve(const ResolutionRoot& root) const override;

        [[nodiscard]] const std::string& command() const noexcept { return command_; }

    private:
        std::string command_;
    };

}  // namespace pinch::resolve

#endif //PINCH_PACKAGE_RESOLVER_HPP
