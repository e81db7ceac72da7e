#pragma once
#include <functional>
#include <string>

namespace starmcp::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

using Sink = std::function<void(Level, const std::string&)>;

const char* to_string(Level level);

/// Parses "DEBUG", "INFO", "WARNING"/"WARN", "ERROR" (any case). Unknown names map to Info.
Level level_from_string(const std::string& name);

void set_level(Level level);
Level level();

/// Replace the output sink. Passing an empty function restores the stderr sink.
void set_sink(Sink sink);

bool enabled(Level level);
void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warning(const std::string& message)
{
    write(Level::Warning, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace starmcp::log
