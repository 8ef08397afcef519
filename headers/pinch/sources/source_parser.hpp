//
// Created by gregorian-rayne on 2/7/26.
//

#ifndef PINCH_SOURCE_PARSER_HPP
#define PINCH_SOURCE_PARSER_HPP

/**
 * @file source_parser.hpp
 * @brief Parsers turning project files into DependencyInfo records.
 *
 * Supported inputs:
 * - Package.resolved: SwiftPM lockfile, format v1 (object.pins[].package)
 *   and v2/v3 (pins[].identity). Lockfiles carry no explicit/transient
 *   distinction, so the explicit set stays empty.
 * - *.deps.json: records file, { "records": [ DependencyInfo... ] },
 *   for records produced by external tools.
 *
 * A parser failure only affects its own file; the scanner reports it and
 * moves on.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"
#include "pinch/model/dependency_info.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pinch::sources {

    /**
     * Records parsed from one file, plus non-fatal problems found in it.
     */
    struct ParsedSource {
        std::vector<model::DependencyInfo> records;
        std::vector<std::string> warnings;
    };

    /**
     * Base interface for all source parsers.
     *
     * Implementations are stateless.
     */
    class ISourceParser {
    public:
        virtual ~ISourceParser() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Checks if this parser handles the file, by file name only.
         */
        [[nodiscard]] virtual bool can_parse(const fs::path& path) const = 0;

        /**
         * @param content     File content.
         * @param source_path Path of the file the content came from.
         */
        [[nodiscard]] virtual Result<ParsedSource, Error> parse_content(
            std::string_view content,
            const fs::path& source_path
        ) const = 0;

        [[nodiscard]] Result<ParsedSource, Error> parse_file(const fs::path& path) const;
    };

    class PackageResolvedParser final : public ISourceParser {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "Package.resolved"; }
        [[nodiscard]] bool can_parse(const fs::path& path) const override;
        [[nodiscard]] Result<ParsedSource, Error> parse_content(
            std::string_view content,
            const fs::path& source_path
        ) const override;
    };

    class RecordsFileParser final : public ISourceParser {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "records"; }
        [[nodiscard]] bool can_parse(const fs::path& path) const override;
        [[nodiscard]] Result<ParsedSource, Error> parse_content(
            std::string_view content,
            const fs::path& source_path
        ) const override;
    };

    /**
     * Registry of the available source parsers.
     */
    class SourceRegistry {
    public:
        /**
         * Gets the singleton registry, with the built-in parsers registered.
         */
        static SourceRegistry& instance();

        void register_parser(std::unique_ptr<ISourceParser> parser);

        /**
         * @return A parser for the file, or nullptr.
         */
        [[nodiscard]] const ISourceParser* find_parser_for_file(const fs::path& path) const;

        [[nodiscard]] std::vector<const ISourceParser*> list_parsers() const;

    private:
        SourceRegistry();

        std::vector<std::unique_ptr<ISourceParser>> parsers_;
    };

    /**
     * Parses a Package.resolved file's content into one record.
     *
     * The record is named after the directory owning the lockfile. For
     * lockfiles inside an .xcodeproj or .xcworkspace bundle that is the
     * bundle, without extension.
     */
    [[nodiscard]] Result<model::DependencyInfo, Error> parse_package_resolved(
        std::string_view content,
        const fs::path& file_path
    );

    /**
     * Loads a records file. Relative record paths are resolved against the
     * file's directory; records without a name are skipped with a warning.
     */
    [[nodiscard]] Result<ParsedSource, Error> load_records_file(const fs::path& path);

}  // namespace pinch::sources

#endif //PINCH_SOURCE_PARSER_HPP
