#include "event_log.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace event_log {

namespace {

std::mutex log_mutex;
Sink log_sink;

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

void write(Level level, const std::string& message) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::ostream& out = (level == Level::INFO) ? std::cout : std::cerr;
        out << "[" << timestamp() << "] " << level_name(level) << " " << message << "\n";
        out.flush();
        sink = log_sink;
    }
    if (sink) sink(level, message);
}

} // namespace

void info(const std::string& message) { write(Level::INFO, message); }
void warn(const std::string& message) { write(Level::WARN, message); }
void error(const std::string& message) { write(Level::ERROR, message); }

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_sink = std::move(sink);
}

const char* level_name(Level level) {
    switch (level) {
        case Level::INFO: return "INFO ";
        case Level::WARN: return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?";
}

} // namespace event_log
