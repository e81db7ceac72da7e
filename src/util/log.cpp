#include "starmcp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace starmcp::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_sink_mutex;
Sink g_sink;

void stderr_sink(Level level, const std::string& message)
{
    std::cerr << "[starmcp] " << to_string(level) << " " << message << std::endl;
}
} // namespace

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    return Level::Info;
}

void set_level(Level level)
{
    g_level.store(static_cast<int>(level));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool enabled(Level level)
{
    return static_cast<int>(level) >= g_level.load();
}

void write(Level level, const std::string& message)
{
    if (!enabled(level))
        return;
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink)
        g_sink(level, message);
    else
        stderr_sink(level, message);
}

} // namespace starmcp::log
