//
// Created by gregorian-rayne on 2/4/26.
//

#include "pinch/heuristics/config.hpp"
#include "pinch/utils/json_utils.hpp"

#include <string>

namespace pinch::heuristics
{
    namespace {

        using json = json_utils::json;

        /**
         * Reads an optional unsigned field into target.
         */
        Result<void, Error> read_count(const json& section, const char* key, std::size_t& target,
                                       const std::string& section_name) {
            if (!section.contains(key)) {
                return Result<void, Error>::success();
            }
            const auto& value = section.at(key);
            if (!value.is_number_integer() || value.get<long long>() < 0) {
                return Result<void, Error>::failure(
                    Error::config_error("Expected a non-negative integer", section_name + "." + key)
                );
            }
            target = value.get<std::size_t>();
            return Result<void, Error>::success();
        }

    }  // namespace

    const char* to_string(const RiskLevel level) noexcept {
        switch (level) {
            case RiskLevel::Low:      return "Low";
            case RiskLevel::Medium:   return "Medium";
            case RiskLevel::High:     return "High";
            case RiskLevel::Critical: return "Critical";
        }
        return "Low";
    }

    RiskLevel classify_risk(const std::size_t transitive_dependents,
                            const RiskThresholds& thresholds) noexcept {
        if (transitive_dependents >= thresholds.critical) {
            return RiskLevel::Critical;
        }
        if (transitive_dependents >= thresholds.high) {
            return RiskLevel::High;
        }
        if (transitive_dependents >= thresholds.medium) {
            return RiskLevel::Medium;
        }
        return RiskLevel::Low;
    }

    Result<void, Error> validate(const PinchConfig& config) {
        const auto& [critical, high, medium] = config.risk;
        if (critical < high || high < medium) {
            return Result<void, Error>::failure(
                Error::config_error("Risk thresholds must satisfy critical >= high >= medium",
                                    std::to_string(critical) + "/" + std::to_string(high) + "/" +
                                    std::to_string(medium))
            );
        }
        if (config.scoring.depth_weight < 0.0) {
            return Result<void, Error>::failure(
                Error::config_error("Depth weight must not be negative", "scoring.depth_weight")
            );
        }
        return Result<void, Error>::success();
    }

    Result<PinchConfig, Error> load_config(const fs::path& path) {
        auto parsed = json_utils::read_file(path);
        if (parsed.is_err()) {
            return Result<PinchConfig, Error>::failure(parsed.error());
        }

        const json& root = parsed.value();
        if (!root.is_object()) {
            return Result<PinchConfig, Error>::failure(
                Error::config_error("Config root must be an object", path.string())
            );
        }

        PinchConfig config = PinchConfig::defaults();

        if (root.contains("risk")) {
            const auto& risk = root.at("risk");
            for (const auto& [key, target] : {
                     std::pair<const char*, std::size_t*>{"critical", &config.risk.critical},
                     std::pair<const char*, std::size_t*>{"high", &config.risk.high},
                     std::pair<const char*, std::size_t*>{"medium", &config.risk.medium}}) {
                if (auto r = read_count(risk, key, *target, "risk"); r.is_err()) {
                    return Result<PinchConfig, Error>::failure(r.error().with_context(path.string()));
                }
            }
        }

        if (root.contains("scoring")) {
            const auto& scoring = root.at("scoring");
            if (scoring.contains("depth_weight")) {
                if (!scoring.at("depth_weight").is_number()) {
                    return Result<PinchConfig, Error>::failure(
                        Error::config_error("Expected a number", "scoring.depth_weight")
                    );
                }
                config.scoring.depth_weight = scoring.at("depth_weight").get<double>();
            }
        }

        if (root.contains("report")) {
            if (auto r = read_count(root.at("report"), "top_n", config.report.top_n, "report"); r.is_err()) {
                return Result<PinchConfig, Error>::failure(r.error().with_context(path.string()));
            }
        }

        if (auto valid = validate(config); valid.is_err()) {
            return Result<PinchConfig, Error>::failure(valid.error());
        }

        return Result<PinchConfig, Error>::success(config);
    }

}  // namespace pinch::heuristics
