#pragma once

#include <functional>
#include <string>

namespace event_log {

enum class Level {
    INFO,
    WARN,
    ERROR
};

// Receives every line after it has been written to the console
using Sink = std::function<void(Level, const std::string&)>;

void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

// Install (or clear, with nullptr) the forwarding sink
void set_sink(Sink sink);

const char* level_name(Level level);

} // namespace event_log
