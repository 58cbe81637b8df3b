/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Sink plus the process-wide slot.
 */
#include "strata/obs/observability.hpp"
#include <atomic>
#include <mutex>
#include <cstdio>

namespace strata::obs {

    namespace {
        std::atomic<Sink*> g_sink{nullptr};
        std::atomic<Level> g_level{Level::Warn};
    }

    class SimpleSink : public Sink {
    public:
        void record(const DiagEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(ctr_, e.kind);
            if (e.level < level() || e.level == Level::Off) return;
            // JSON-ish line (one event per line)
            std::fprintf(stderr,
              R"({"level":"%s","event":"%s","component":"%s","msg":"%s"})" "\n",
              to_string(e.level), to_string(e.kind), e.component.c_str(), e.message.c_str());
            std::fflush(stderr);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Sink* make_simple_sink() {
        static SimpleSink s; // process-wide singleton
        return &s;
    }

    void install_sink(Sink* s) noexcept {
        g_sink.store(s, std::memory_order_release);
    }

    Sink& sink() noexcept {
        Sink* s = g_sink.load(std::memory_order_acquire);
        return s ? *s : *make_simple_sink();
    }

    void set_level(Level l) noexcept { g_level.store(l, std::memory_order_relaxed); }
    Level level() noexcept { return g_level.load(std::memory_order_relaxed); }

    bool enabled(Level l) noexcept {
        return l != Level::Off && l >= level();
    }

    void emit(EventKind kind, Level l, std::string_view component, std::string message) {
        sink().record(DiagEvent{kind, l, std::string(component), std::move(message)});
    }

    void count(Counters& c, EventKind kind) noexcept {
        switch (kind) {
            case EventKind::Decoded:             c.decoded++; break;
            case EventKind::Encoded:             c.encoded++; break;
            case EventKind::DispatchFallback:    c.dispatch_fallbacks++; break;
            case EventKind::DecodeFailed:        c.decode_failures++; break;
            case EventKind::PackFailed:          c.pack_failures++; break;
            case EventKind::TriggerlistFallback: c.triggerlist_fallbacks++; break;
            case EventKind::DepthLimit:
            case EventKind::Config:              break;
        }
    }

    const char* to_string(Level l) noexcept {
        switch (l) {
            case Level::Trace: return "trace";
            case Level::Debug: return "debug";
            case Level::Info:  return "info";
            case Level::Warn:  return "warn";
            case Level::Error: return "error";
            case Level::Off:   return "off";
        }
        return "unknown";
    }

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Decoded:             return "decoded";
            case EventKind::Encoded:             return "encoded";
            case EventKind::DispatchFallback:    return "dispatch_fallback";
            case EventKind::DecodeFailed:        return "decode_failed";
            case EventKind::PackFailed:          return "pack_failed";
            case EventKind::TriggerlistFallback: return "triggerlist_fallback";
            case EventKind::DepthLimit:          return "depth_limit";
            case EventKind::Config:              return "config";
        }
        return "unknown";
    }

} // namespace strata::obs
