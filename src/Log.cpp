#include <a2s/Log.hpp>
#include <atomic>

namespace a2s::log {

static std::atomic<Level> g_minLevel{Level::Info};

void setLogFunction(LogFunction func) {
    getLogFunction() = std::move(func);
}

LogFunction& getLogFunction() {
    // default function
    static LogFunction function = [](Level level, const std::string& message) {
        fmt::println("[a2s] [{}] {}", levelToString(level), message);
    };

    return function;
}

void setMinLevel(Level level) {
    g_minLevel.store(level, std::memory_order_relaxed);
}

Level minLevel() {
    return g_minLevel.load(std::memory_order_relaxed);
}

std::string_view levelToString(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
    }

    return "UNKNOWN";
}

}
