//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_VERSION_HPP
#define PINCH_VERSION_HPP

/**
 * @file version.hpp
 * @brief Pinch version information.
 */

namespace pinch {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 2;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.2.0";

    constexpr auto PROJECT_NAME = "Pinch Point Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "pinch";

}  // namespace pinch

#endif //PINCH_VERSION_HPP
