#include "keyward/log/Log.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace keyward::log
{
namespace
{

std::atomic<Level> g_level{ Level::Warning };
std::atomic<std::ostream*> g_sink{ nullptr };
std::mutex g_writeMutex;

[[nodiscard]] std::string timestamp()
{
    const auto now{ std::chrono::system_clock::now() };
    const std::time_t seconds{ std::chrono::system_clock::to_time_t(now) };
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000 };

    std::tm local{};
    localtime_r(&seconds, &local);

    constexpr std::size_t kStampBytes{ 32U };
    std::array<char, kStampBytes> buf{};
    std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d %02d:%02d:%02d.%03d", local.tm_year + 1900,
                  local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec,
                  static_cast<int>(millis));
    return std::string{ buf.data() };
}

} // namespace

void setLevel(Level lvl) noexcept
{
    g_level.store(lvl);
}

Level level() noexcept
{
    return g_level.load();
}

void setSink(std::ostream* sink) noexcept
{
    g_sink.store(sink);
}

std::optional<Level> parseLevel(std::string_view name) noexcept
{
    std::string lowered{};
    for (const char c : name)
    {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "debug")
    {
        return Level::Debug;
    }
    if (lowered == "info")
    {
        return Level::Info;
    }
    if (lowered == "warning" || lowered == "warn")
    {
        return Level::Warning;
    }
    if (lowered == "error")
    {
        return Level::Error;
    }
    if (lowered == "off" || lowered == "none")
    {
        return Level::Off;
    }
    return std::nullopt;
}

std::string_view levelName(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO ";
    case Level::Warning:
        return "WARN ";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF  ";
    }
    return "?    ";
}

void write(Level lvl, std::string_view component, std::string_view message)
{
    std::ostringstream line;
    line << '[' << timestamp() << "] " << levelName(lvl) << ' ' << component << ": " << message << '\n';

    const std::lock_guard lock{ g_writeMutex };
    std::ostream* sink{ g_sink.load() };
    std::ostream& out{ sink != nullptr ? *sink : std::cerr };
    out << line.str() << std::flush;
}

} // namespace keyward::log
