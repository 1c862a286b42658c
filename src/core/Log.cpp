#include "Log.hpp"

#include <atomic>
#include <mutex>
#include <ostream>

namespace {
    std::atomic<std::ostream*> g_sink{nullptr};
    std::atomic<Log::Level> g_level{Log::Level::Warn};
    std::mutex g_write_mutex;

    const char* tag(Log::Level lv) {
        switch (lv) {
            case Log::Level::Debug: return "debug";
            case Log::Level::Info: return "info";
            case Log::Level::Warn: return "warning";
            case Log::Level::Error: return "error";
            case Log::Level::Off: break;
        }
        return "";
    }

    void write(Log::Level lv, const std::string& msg) {
        std::ostream* sink = g_sink.load();
        if (!sink || lv == Log::Level::Off || lv < g_level.load()) return;
        std::lock_guard<std::mutex> lock(g_write_mutex);
        (*sink) << "agentsh: " << tag(lv) << ": " << msg << "\n";
    }
}

namespace Log {
    void set_sink(std::ostream* sink) { g_sink.store(sink); }
    void set_level(Level level) { g_level.store(level); }
    Level level() { return g_level.load(); }

    void debug(const std::string& msg) { write(Level::Debug, msg); }
    void info(const std::string& msg) { write(Level::Info, msg); }
    void warn(const std::string& msg) { write(Level::Warn, msg); }
    void error(const std::string& msg) { write(Level::Error, msg); }
}
