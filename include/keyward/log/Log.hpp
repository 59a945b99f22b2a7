#ifndef INCLUDE_KEYWARD_LOG_LOG_HPP
#define INCLUDE_KEYWARD_LOG_LOG_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

// Leveled logging with a runtime filter.
//
//   keyward::log::setLevel(keyward::log::Level::Debug);
//   keyward::log::info("store", "vault persisted: ", path, " (", count, " accounts)");
//
// Output format: [YYYY-MM-DD HH:MM:SS.mmm] LEVEL component: message
// Lines are written whole under a mutex, so concurrent callers never interleave.
// Never pass passphrases, keys or secret values.
namespace keyward::log
{

enum class Level : std::uint8_t
{
    Debug,
    Info,
    Warning,
    Error,
    Off,
};

void setLevel(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

// nullptr restores std::cerr. The stream must outlive every log call made while it is installed.
void setSink(std::ostream* sink) noexcept;

[[nodiscard]] std::optional<Level> parseLevel(std::string_view name) noexcept;
[[nodiscard]] std::string_view levelName(Level level) noexcept;

[[nodiscard]] inline bool enabled(Level lvl) noexcept
{
    return lvl != Level::Off && lvl >= level();
}

void write(Level lvl, std::string_view component, std::string_view message);

template <typename... Args> void log(Level lvl, std::string_view component, Args&&... args)
{
    if (!enabled(lvl))
    {
        return;
    }
    std::ostringstream message;
    (message << ... << std::forward<Args>(args));
    write(lvl, component, message.str());
}

template <typename... Args> void debug(std::string_view component, Args&&... args)
{
    log(Level::Debug, component, std::forward<Args>(args)...);
}

template <typename... Args> void info(std::string_view component, Args&&... args)
{
    log(Level::Info, component, std::forward<Args>(args)...);
}

template <typename... Args> void warning(std::string_view component, Args&&... args)
{
    log(Level::Warning, component, std::forward<Args>(args)...);
}

template <typename... Args> void error(std::string_view component, Args&&... args)
{
    log(Level::Error, component, std::forward<Args>(args)...);
}

} // namespace keyward::log

#endif // INCLUDE_KEYWARD_LOG_LOG_HPP
