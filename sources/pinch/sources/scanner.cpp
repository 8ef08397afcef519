//
// Created by gregorian-rayne on 2/7/26.
//

#include "pinch/sources/scanner.hpp"
#include "pinch/sources/source_parser.hpp"
#include "pinch/utils/file_utils.hpp"
#include "pinch/utils/path_utils.hpp"

#include <algorithm>
#include <functional>

namespace pinch::sources {

    namespace {

        void parse_into(const fs::path& file, ScanResult& result) {
            const auto* parser = SourceRegistry::instance().find_parser_for_file(file);
            if (!parser) {
                return;
            }

            auto parsed = parser->parse_file(file);
            if (parsed.is_err()) {
                result.skipped.push_back(file.string() + ": " + parsed.error().message());
                return;
            }

            auto& source = parsed.value();
            for (auto& warning : source.warnings) {
                result.skipped.push_back(std::move(warning));
            }
            if (!source.records.empty()) {
                result.files.push_back(file);
            }
            for (auto& record : source.records) {
                result.records.push_back(std::move(record));
            }
        }

        bool excluded(const fs::path& dir, const ScanOptions& options) {
            if (options.skip_hidden && file_utils::is_hidden(dir)) {
                return true;
            }
            const auto name = dir.filename().string();
            return std::ranges::find(options.excluded_dirs, name) != options.excluded_dirs.end();
        }

    }  // namespace

    Result<ScanResult, Error> scan_directory(const fs::path& root, const ScanOptions& options) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            return Result<ScanResult, Error>::failure(
                Error::not_found("Directory does not exist", root.string())
            );
        }

        ScanResult result;
        result.root = path_utils::normalize(fs::absolute(root, ec));
        if (ec) {
            return Result<ScanResult, Error>::failure(
                Error::io_error("Cannot resolve scan root", root.string())
            );
        }

        if (fs::is_regular_file(result.root, ec)) {
            parse_into(result.root, result);
            result.root = result.root.parent_path();
            return Result<ScanResult, Error>::success(std::move(result));
        }

        // Directory order is unspecified; sort per directory level so the
        // record order is reproducible. The builder does not depend on it.
        std::vector<fs::path> pending{result.root};
        while (!pending.empty()) {
            const fs::path dir = std::move(pending.back());
            pending.pop_back();

            std::vector<fs::path> files;
            std::vector<fs::path> subdirs;
            for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
                 !ec && it != end; it.increment(ec)) {
                const auto& entry = *it;
                std::error_code entry_ec;
                if (entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec)) {
                    if (!excluded(entry.path(), options)) {
                        subdirs.push_back(entry.path());
                    }
                } else if (entry.is_regular_file(entry_ec)) {
                    if (!(options.skip_hidden && file_utils::is_hidden(entry.path()))) {
                        files.push_back(entry.path());
                    }
                }
            }
            if (ec) {
                result.skipped.push_back(dir.string() + ": " + ec.message());
                ec.clear();
            }

            std::ranges::sort(files);
            for (const auto& file : files) {
                parse_into(file, result);
            }

            std::ranges::sort(subdirs, std::ranges::greater{});
            for (auto& sub : subdirs) {
                pending.push_back(std::move(sub));
            }
        }

        return Result<ScanResult, Error>::success(std::move(result));
    }

}  // namespace pinch::sources
