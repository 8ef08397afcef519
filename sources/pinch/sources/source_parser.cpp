//
// Created by gregorian-rayne on 2/7/26.
//

#include "pinch/sources/source_parser.hpp"
#include "pinch/utils/file_utils.hpp"
#include "pinch/utils/json_utils.hpp"
#include "pinch/utils/path_utils.hpp"
#include "pinch/utils/string_utils.hpp"

#include <algorithm>

namespace pinch::sources {

    namespace {

        using json = nlohmann::json;

        /**
         * Directory that owns a lockfile. Xcode keeps Package.resolved deep
         * inside the project bundle, so the nearest .xcodeproj or
         * .xcworkspace ancestor wins over the immediate parent.
         */
        bool is_bundle(const fs::path& path) {
            const auto ext = string_utils::to_lower(path.extension().string());
            return ext == ".xcodeproj" || ext == ".xcworkspace";
        }

        fs::path lockfile_owner(const fs::path& file_path) {
            fs::path parent = file_path.parent_path();
            if (parent.empty()) {
                parent = fs::absolute(file_path).parent_path();
            }

            for (fs::path current = parent; !current.empty(); current = current.parent_path()) {
                if (is_bundle(current)) {
                    return current;
                }
                if (current == current.parent_path()) {
                    break;
                }
            }
            return parent;
        }

        const json* find_pins(const json& document) {
            if (const auto it = document.find("pins"); it != document.end() && it->is_array()) {
                return &*it;
            }
            if (const auto object = document.find("object"); object != document.end() && object->is_object()) {
                if (const auto it = object->find("pins"); it != object->end() && it->is_array()) {
                    return &*it;
                }
            }
            return nullptr;
        }

    }  // namespace

    // ============================================================================
    // ISourceParser
    // ============================================================================

    Result<ParsedSource, Error> ISourceParser::parse_file(const fs::path& path) const {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<ParsedSource, Error>::failure(content.error());
        }
        return parse_content(content.value(), path);
    }

    // ============================================================================
    // Package.resolved
    // ============================================================================

    Result<model::DependencyInfo, Error> parse_package_resolved(const std::string_view content,
                                                                const fs::path& file_path) {
        auto parsed = json_utils::parse(content);
        if (parsed.is_err()) {
            return Result<model::DependencyInfo, Error>::failure(
                Error::parse_error(parsed.error().message(), file_path.string())
            );
        }

        const json& document = parsed.value();
        if (!document.is_object()) {
            return Result<model::DependencyInfo, Error>::failure(
                Error::parse_error("Package.resolved root is not an object", file_path.string())
            );
        }

        const json* pins = find_pins(document);
        if (!pins) {
            return Result<model::DependencyInfo, Error>::failure(
                Error::parse_error("Package.resolved has no pins", file_path.string())
            );
        }

        const fs::path owner = lockfile_owner(file_path);

        model::DependencyInfo info;
        info.path = owner;
        info.name = is_bundle(owner) ? owner.stem().string() : owner.filename().string();
        info.source = model::RecordSource::Lockfile;

        for (const auto& pin : *pins) {
            if (!pin.is_object()) {
                continue;
            }
            // v2 and v3 use "identity", v1 used "package"
            auto name = json_utils::get_or<std::string>(pin, "identity", "");
            if (name.empty()) {
                name = json_utils::get_or<std::string>(pin, "package", "");
            }
            if (!string_utils::trim(name).empty()) {
                info.dependencies.push_back(std::move(name));
            }
        }

        return Result<model::DependencyInfo, Error>::success(std::move(info));
    }

    bool PackageResolvedParser::can_parse(const fs::path& path) const {
        return path.filename() == "Package.resolved";
    }

    Result<ParsedSource, Error> PackageResolvedParser::parse_content(const std::string_view content,
                                                                     const fs::path& source_path) const {
        auto info = parse_package_resolved(content, source_path);
        if (info.is_err()) {
            return Result<ParsedSource, Error>::failure(info.error());
        }

        ParsedSource result;
        result.records.push_back(std::move(info).value());
        return Result<ParsedSource, Error>::success(std::move(result));
    }

    // ============================================================================
    // Records file
    // ============================================================================

    bool RecordsFileParser::can_parse(const fs::path& path) const {
        return string_utils::ends_with(path.filename().string(), ".deps.json");
    }

    Result<ParsedSource, Error> RecordsFileParser::parse_content(const std::string_view content,
                                                                 const fs::path& source_path) const {
        auto parsed = json_utils::parse(content);
        if (parsed.is_err()) {
            return Result<ParsedSource, Error>::failure(
                Error::parse_error(parsed.error().message(), source_path.string())
            );
        }

        const json& document = parsed.value();
        const json* records = nullptr;
        if (document.is_array()) {
            records = &document;
        } else if (document.is_object()) {
            if (const auto it = document.find("records"); it != document.end() && it->is_array()) {
                records = &*it;
            }
        }
        if (!records) {
            return Result<ParsedSource, Error>::failure(
                Error::parse_error("Records file has no \"records\" array", source_path.string())
            );
        }

        const fs::path base = source_path.parent_path();

        ParsedSource result;
        std::size_t index = 0;
        for (const auto& item : *records) {
            try {
                auto info = item.get<model::DependencyInfo>();
                if (info.path.empty()) {
                    info.path = base;
                } else if (info.path.is_relative()) {
                    info.path = path_utils::normalize(base / info.path);
                }
                result.records.push_back(std::move(info));
            } catch (const json::exception& e) {
                result.warnings.push_back(source_path.string() + ": skipping record " +
                                          std::to_string(index) + ": " + e.what());
            }
            ++index;
        }

        return Result<ParsedSource, Error>::success(std::move(result));
    }

    Result<ParsedSource, Error> load_records_file(const fs::path& path) {
        return RecordsFileParser{}.parse_file(path);
    }

    // ============================================================================
    // SourceRegistry
    // ============================================================================

    SourceRegistry::SourceRegistry() {
        parsers_.push_back(std::make_unique<PackageResolvedParser>());
        parsers_.push_back(std::make_unique<RecordsFileParser>());
    }

    SourceRegistry& SourceRegistry::instance() {
        static SourceRegistry registry;
        return registry;
    }

    void SourceRegistry::register_parser(std::unique_ptr<ISourceParser> parser) {
        parsers_.push_back(std::move(parser));
    }

    const ISourceParser* SourceRegistry::find_parser_for_file(const fs::path& path) const {
        const auto it = std::ranges::find_if(parsers_, [&](const auto& parser) {
            return parser->can_parse(path);
        });
        return it == parsers_.end() ? nullptr : it->get();
    }

    std::vector<const ISourceParser*> SourceRegistry::list_parsers() const {
        std::vector<const ISourceParser*> result;
        result.reserve(parsers_.size());
        for (const auto& parser : parsers_) {
            result.push_back(parser.get());
        }
        return result;
    }

}  // namespace pinch::sources
