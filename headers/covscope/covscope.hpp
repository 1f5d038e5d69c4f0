//
// Created by gregorian-rayne on 02/16/26.
//

#ifndef COVSCOPE_COVSCOPE_HPP
#define COVSCOPE_COVSCOPE_HPP

/**
 * @file covscope.hpp
 * @brief Main header for the covscope library.
 *
 * Include this header for general usage, or include specific
 * headers for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "logging.hpp"
#include "service.hpp"
#include "core/config.hpp"
#include "aggregator/comparison.hpp"
#include "exporters/summary_json.hpp"
#include "utils/file_utils.hpp"

#endif //COVSCOPE_COVSCOPE_HPP
