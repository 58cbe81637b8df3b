#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the codec and its diagnostics.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader in deployments.
 */

#include <cstddef>
#include <cstdint>

#include "strata/obs/observability.hpp"

namespace strata::config::constants {

// =====================
// Diagnostics
// =====================
/// Print threshold for the default sink (events below are only counted).
inline constexpr obs::Level LOG_LEVEL_DEFAULT = obs::Level::Warn;

// =====================
// Dissection
// =====================
/// Maximum number of nested layers instantiated by discriminator dispatch.
/// Deeper data stays an opaque raw body.
inline constexpr std::size_t MAX_LAYER_DEPTH = 16;

/// Keep bytes of an upper layer that failed to decode as a raw body (true),
/// or report the upper layer's error to the caller (false).
inline constexpr bool DEGRADE_FAILED_HANDLERS = true;

// =====================
// Config file keys
// =====================
inline constexpr const char* KEY_LOG_LEVEL               = "log_level";
inline constexpr const char* KEY_MAX_LAYER_DEPTH         = "max_layer_depth";
inline constexpr const char* KEY_DEGRADE_FAILED_HANDLERS = "degrade_failed_handlers";

} // namespace strata::config::constants
