/**
* @file config_loader.cpp
 * @brief TOML loader (toml++) returning named defaults for anything missing.
 */
#include "strata/config/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <optional>

#include <toml++/toml.hpp>

namespace strata::config {
    using namespace strata::config::constants;

    namespace {
        CodecConfig g_active{};

        std::optional<obs::Level> parse_level(std::string_view v) {
            if (v == "trace") return obs::Level::Trace;
            if (v == "debug") return obs::Level::Debug;
            if (v == "info")  return obs::Level::Info;
            if (v == "warn")  return obs::Level::Warn;
            if (v == "error") return obs::Level::Error;
            if (v == "off")   return obs::Level::Off;
            return std::nullopt;
        }

        void report(const toml::node& node, std::string_view key, std::string_view what) {
            obs::emit(obs::EventKind::Config, obs::Level::Warn, "config",
                      "line " + std::to_string(node.source().begin.line) + ": " +
                      std::string(what) + " for '" + std::string(key) + "'");
        }

        void report_parse_error(const toml::parse_error& err) {
            obs::emit(obs::EventKind::Config, obs::Level::Warn, "config",
                      "line " + std::to_string(err.source().begin.line) + ": " +
                      std::string(err.description()) + ", using defaults");
        }

        CodecConfig from_table(const toml::table& tbl) {
            CodecConfig cfg;
            for (auto&& [k, node] : tbl) {
                const std::string_view key = k.str();
                if (key == KEY_LOG_LEVEL) {
                    const auto* s = node.as_string();
                    if (auto l = s ? parse_level(s->get()) : std::nullopt) cfg.log_level = *l;
                    else report(node, key, "bad log level");
                } else if (key == KEY_MAX_LAYER_DEPTH) {
                    const auto* i = node.as_integer();
                    if (i && i->get() > 0) cfg.max_layer_depth = static_cast<std::size_t>(i->get());
                    else report(node, key, "bad layer depth");
                } else if (key == KEY_DEGRADE_FAILED_HANDLERS) {
                    if (const auto* b = node.as_boolean()) cfg.degrade_failed_handlers = b->get();
                    else report(node, key, "bad boolean");
                } else {
                    report(node, key, "unknown key");
                }
            }
            return cfg;
        }
    }

    CodecConfig Loader::parse(std::string_view text) {
        try {
            return from_table(toml::parse(text));
        } catch (const toml::parse_error& err) {
            report_parse_error(err);
            return CodecConfig{};
        }
    }

    CodecConfig Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            obs::emit(obs::EventKind::Config, obs::Level::Info, "config",
                      "no config at '" + path + "', using defaults");
            return CodecConfig{};
        }
        try {
            return from_table(toml::parse(in, path));
        } catch (const toml::parse_error& err) {
            report_parse_error(err);
            return CodecConfig{};
        }
    }

    void apply(const CodecConfig& cfg) {
        g_active = cfg;
        obs::set_level(cfg.log_level);
        obs::emit(obs::EventKind::Config, obs::Level::Debug, "config",
                  "applied: max_layer_depth=" + std::to_string(cfg.max_layer_depth) +
                  " degrade_failed_handlers=" + (cfg.degrade_failed_handlers ? "true" : "false"));
    }

    const CodecConfig& active() noexcept {
        return g_active;
    }

} // namespace strata::config
