#pragma once
/**
 * @file bp_base.hpp
 * @brief Layer 1: Basic modules built on bp_platform.
 *
 * Provides format_tools, debug_info, scope_guard, Result and module_def. Include this when you
 * need formatting, debug utilities or basic RAII guards.
 */
#include "bp_platform.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
#include "utils/module_def.hpp"
