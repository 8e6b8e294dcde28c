#pragma once
/**
 * @file bp_service.hpp
 * @brief Layer 2: Service modules built on bp_base.
 *
 * Provides lifecycle management and the asynchronous Logger.
 */
#include "bp_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
