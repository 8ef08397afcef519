//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef PINCH_PINCH_HPP
#define PINCH_PINCH_HPP

/**
 * @file pinch.hpp
 * @brief Main header for the pinch library.
 *
 * Include this header for general usage, or include specific headers for
 * more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "graph/graph.hpp"
#include "graph/graph_builder.hpp"
#include "analysis/pinch_point_analyzer.hpp"
#include "analysis/graph_diff.hpp"

#endif //PINCH_PINCH_HPP
