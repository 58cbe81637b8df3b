#pragma once
/**
 * @file observability.hpp
 * @brief Process-wide diagnostic sink: codec events + counters.
 * @details Installed once at startup (see config::apply). Independent of codec
 *          correctness: nothing in the codec reads back what the sink recorded.
 */

#include <string>
#include <string_view>
#include <cstdint>

namespace strata::obs {

    /** @enum Level
     *  @brief Severity threshold for printed diagnostics.
     */
    enum class Level : std::uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

    /** @enum EventKind
     *  @brief What happened; drives the counters.
     */
    enum class EventKind : std::uint8_t {
        Decoded,             ///< A layer decoded successfully
        Encoded,             ///< A layer serialized successfully
        DispatchFallback,    ///< Upper layer kept as raw bytes (unknown type or failed decode)
        DecodeFailed,        ///< Decode returned an error to the caller
        PackFailed,          ///< Serialize returned an error to the caller
        TriggerlistFallback, ///< Triggerlist parser failed; raw bytes kept as one element
        DepthLimit,          ///< Nesting guard stopped dispatch
        Config               ///< Configuration notice (unknown key, bad value, applied)
    };

    /** @struct Counters
     *  @brief Process-level codec counters.
     */
    struct Counters {
        uint64_t decoded{0};               ///< Successful layer decodes
        uint64_t encoded{0};               ///< Successful layer serializations
        uint64_t dispatch_fallbacks{0};    ///< Upper layers degraded to raw bytes
        uint64_t decode_failures{0};       ///< Decode errors reported to callers
        uint64_t pack_failures{0};         ///< Serialize errors reported to callers
        uint64_t triggerlist_fallbacks{0}; ///< Triggerlist parser failures
    };

    /** @struct DiagEvent
     *  @brief Payload describing a single diagnostic event.
     */
    struct DiagEvent {
        EventKind   kind{EventKind::Config}; ///< Event classification
        Level       level{Level::Debug};     ///< Severity
        std::string component;               ///< Emitting layer/module (e.g. "Ip4")
        std::string message;                 ///< Human-readable detail
    };

    /** @class Sink
     *  @brief Diagnostic sink interface.
     */
    class Sink {
    public:
        virtual ~Sink() = default;
        /// Record a single event.
        virtual void record(const DiagEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// printf-backed process-wide default sink (implemented in .cpp).
    Sink* make_simple_sink();

    /// Replace the process-wide sink; nullptr restores the simple sink.
    void install_sink(Sink* s) noexcept;

    /// Currently installed sink.
    Sink& sink() noexcept;

    /// Print threshold used by the simple sink.
    void set_level(Level l) noexcept;
    Level level() noexcept;

    /// True if an event at @p l would be printed.
    bool enabled(Level l) noexcept;

    /// Convenience: build a DiagEvent and hand it to the installed sink.
    void emit(EventKind kind, Level l, std::string_view component, std::string message);

    const char* to_string(Level l) noexcept;
    const char* to_string(EventKind k) noexcept;

    /// Apply an event to a counter set (shared by sink implementations).
    void count(Counters& c, EventKind kind) noexcept;

} // namespace strata::obs
