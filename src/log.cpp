#include <fogmap/log.hpp>

#include <iostream>
#include <mutex>
#include <utility>

namespace fogmap {

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

LogSink& current_sink() {
    static LogSink sink;
    return sink;
}

void emit(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    const LogSink& sink = current_sink();
    if (sink) {
        sink(level, msg);
        return;
    }
    // stdout は GeoJSON 用なので、診断は常に stderr へ
    std::cerr << (level == LogLevel::warn ? "[warn] " : "[info] ") << msg << "\n";
}

} // namespace

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = std::move(sink);
}

void log_info(const std::string& msg) { emit(LogLevel::info, msg); }

void log_warn(const std::string& msg) { emit(LogLevel::warn, msg); }

} // namespace fogmap
