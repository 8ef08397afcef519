//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_TYPES_HPP
#define PINCH_TYPES_HPP

/**
 * @file types.hpp
 * @brief Basic aliases shared by every module.
 */

#include <chrono>
#include <filesystem>

namespace pinch {

    namespace fs = std::filesystem;

    /**
     * Duration in nanoseconds, used for resolver timing.
     */
    using Duration = std::chrono::nanoseconds;

}  // namespace pinch

#endif //PINCH_TYPES_HPP
