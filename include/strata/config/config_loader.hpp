#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: parse TOML files (toml++) into a CodecConfig.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include "strata/config/constants.hpp"
#include "strata/obs/observability.hpp"

namespace strata::config {

    /** @struct CodecConfig
     *  @brief Process-wide codec settings.
     */
    struct CodecConfig {
        obs::Level  log_level{constants::LOG_LEVEL_DEFAULT};                       ///< Sink print threshold
        std::size_t max_layer_depth{constants::MAX_LAYER_DEPTH};                   ///< Dispatch nesting guard
        bool        degrade_failed_handlers{constants::DEGRADE_FAILED_HANDLERS};   ///< Failed upper layer -> raw body

        bool operator==(const CodecConfig&) const = default;
    };

    /** @class Loader
     *  @brief Source of codec configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from a path or return defaults.
         * @param path TOML document with top-level keys, e.g.
         *             log_level = "debug", max_layer_depth = 8,
         *             degrade_failed_handlers = false
         * @return CodecConfig; a missing or unparsable file yields defaults, bad
         *         entries keep their defaults. Problems are reported through the
         *         diagnostic sink.
         */
        static CodecConfig load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory TOML document.
        static CodecConfig parse(std::string_view text);
    };

    /// Install @p cfg process-wide (call once at startup, before decoding).
    void apply(const CodecConfig& cfg);

    /// Currently applied configuration (defaults until apply() is called).
    const CodecConfig& active() noexcept;

} // namespace strata::config
