//
// Created by gregorian-rayne on 2/7/26.
//

#ifndef PINCH_SCANNER_HPP
#define PINCH_SCANNER_HPP

/**
 * @file scanner.hpp
 * @brief Discovers dependency records below a scan root.
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"
#include "pinch/model/dependency_info.hpp"

#include <string>
#include <vector>

namespace pinch::sources {

    struct ScanOptions {
        /// Directory names never descended into
        std::vector<std::string> excluded_dirs = {".build", "DerivedData", "node_modules"};

        bool skip_hidden = true;
    };

    struct ScanResult {
        /// Absolute scan root, the base for stable ids
        fs::path root;

        std::vector<model::DependencyInfo> records;

        /// Files that produced records, in discovery order
        std::vector<fs::path> files;

        /// Files or records that were skipped, with the reason
        std::vector<std::string> skipped;

        /// Nothing to analyze
        [[nodiscard]] bool empty() const noexcept { return records.empty(); }
    };

    /**
     * Walks root once, parsing every file a registered source parser
     * accepts. root may also name a single source file.
     *
     * A missing root is a NotFound error. Unparsable files are recorded in
     * ScanResult::skipped and do not fail the scan.
     */
    [[nodiscard]] Result<ScanResult, Error> scan_directory(const fs::path& root,
                                                           const ScanOptions& options = {});

}  // namespace pinch::sources

#endif //PINCH_SCANNER_HPP
