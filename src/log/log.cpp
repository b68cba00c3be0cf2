#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sandpit/log/log.h>

namespace sandpit::log
{
namespace
{

Level initial_threshold()
{
    if (const char* env = std::getenv("SANDPIT_LOG"); env != nullptr)
    {
        if (auto level = parse_level(env))
        {
            return *level;
        }
    }
    return Level::Warn;
}

std::atomic<Level>& threshold_slot()
{
    static std::atomic<Level> slot{initial_threshold()};
    return slot;
}

std::mutex& stderr_mutex()
{
    static std::mutex m;
    return m;
}

} // namespace

std::optional<Level> parse_level(std::string_view text)
{
    if (text == "debug")
    {
        return Level::Debug;
    }
    if (text == "info")
    {
        return Level::Info;
    }
    if (text == "warn" || text == "warning")
    {
        return Level::Warn;
    }
    if (text == "error")
    {
        return Level::Error;
    }
    return std::nullopt;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "error";
}

Level threshold()
{
    return threshold_slot().load(std::memory_order_relaxed);
}

void set_threshold(Level level)
{
    threshold_slot().store(level, std::memory_order_relaxed);
}

bool enabled(Level level)
{
    return static_cast<int>(level) >= static_cast<int>(threshold());
}

std::string format_record(Level level, std::string_view message)
{
    std::string out = "sandpit: ";
    out += to_string(level);
    out += ": ";
    for (char c : message)
    {
        out.push_back(c == '\n' || c == '\r' ? ' ' : c);
    }
    out.push_back('\n');
    return out;
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
    {
        return;
    }
    const std::string record = format_record(level, message);
    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << record << std::flush;
}

} // namespace sandpit::log
