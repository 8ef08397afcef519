//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef PINCH_HEURISTICS_CONFIG_HPP
#define PINCH_HEURISTICS_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Pinch-point scoring policy.
 *
 * The thresholds and the depth weight are policy constants, not derived
 * values. Both can be overridden from the command line or from a JSON
 * config file:
 *
 * @code
 *     {
 *       "risk":    { "critical": 20, "high": 10, "medium": 5 },
 *       "scoring": { "depth_weight": 0.2 },
 *       "report":  { "top_n": 10 }
 *     }
 * @endcode
 */

#include "pinch/result.hpp"
#include "pinch/error.hpp"
#include "pinch/types.hpp"

#include <cstddef>

namespace pinch::heuristics
{
    /**
     * @brief Risk tier thresholds on transitive dependents.
     */
    struct RiskThresholds {
        /// transitive dependents >= critical
        std::size_t critical = 20;

        /// high <= transitive dependents < critical
        std::size_t high = 10;

        /// medium <= transitive dependents < high
        std::size_t medium = 5;
    };

    /**
     * @brief Impact score weighting.
     *
     * impact = transitive_dependents * (1 + depth * depth_weight)
     */
    struct ScoringConfig {
        double depth_weight = 0.2;
    };

    struct ReportConfig {
        /// Rows shown in ranked tables
        std::size_t top_n = 10;
    };

    struct PinchConfig {
        RiskThresholds risk;
        ScoringConfig scoring;
        ReportConfig report;

        static PinchConfig defaults() {
            return PinchConfig{};
        }
    };

    enum class RiskLevel {
        Low,
        Medium,
        High,
        Critical
    };

    [[nodiscard]] const char* to_string(RiskLevel level) noexcept;

    /**
     * Maps a transitive dependent count to its risk tier.
     */
    [[nodiscard]] RiskLevel classify_risk(std::size_t transitive_dependents,
                                          const RiskThresholds& thresholds) noexcept;

    /**
     * Checks critical >= high >= medium and a non-negative depth weight.
     */
    [[nodiscard]] Result<void, Error> validate(const PinchConfig& config);

    /**
     * Loads a JSON config file on top of the defaults.
     *
     * Missing keys keep their default. A wrong type or an invalid
     * combination is a ConfigError.
     */
    [[nodiscard]] Result<PinchConfig, Error> load_config(const fs::path& path);

}  // namespace pinch::heuristics

#endif //PINCH_HEURISTICS_CONFIG_HPP
