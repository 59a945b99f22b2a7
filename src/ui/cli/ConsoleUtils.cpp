#include "ConsoleUtils.hpp"
#include "keyward/log/Log.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <optional>
#include <span>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace keyward::ui::cli
{

namespace
{

// Restores the terminal settings on every exit path.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (::isatty(STDIN_FILENO) == 0 || ::tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios quiet
        {
            m_saved
        };
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = ::tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (m_active)
        {
            (void)::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        }
    }

    [[nodiscard]] bool active() const noexcept
    {
        return m_active;
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

MemoryLock chooseMemoryLock(rlim_t memlockLimit) noexcept
{
    return memlockLimit == RLIM_INFINITY ? MemoryLock::All : MemoryLock::CurrentOnly;
}

ProcessHardening hardenProcess() noexcept
{
    ProcessHardening result{};

    struct rlimit memlock
    {
        0, 0
    };
    if (::getrlimit(RLIMIT_MEMLOCK, &memlock) != 0)
    {
        keyward::log::warning("cli", "reading RLIMIT_MEMLOCK failed: ", std::strerror(errno));
    }
    else
    {
        const MemoryLock wanted{ chooseMemoryLock(memlock.rlim_cur) };
        const int flags{ wanted == MemoryLock::All ? (MCL_CURRENT | MCL_FUTURE) : MCL_CURRENT };
        if (::mlockall(flags) != 0)
        {
            keyward::log::warning("cli", "mlockall failed: ", std::strerror(errno));
        }
        else
        {
            result.memory = wanted;
            if (wanted == MemoryLock::CurrentOnly)
            {
                keyward::log::warning("cli", "RLIMIT_MEMLOCK is ", memlock.rlim_cur,
                                      " bytes; later allocations are not pinned");
            }
        }
    }

    struct rlimit core
    {
        0, 0
    };
    if (::setrlimit(RLIMIT_CORE, &core) != 0)
    {
        keyward::log::warning("cli", "disabling core dumps failed: ", std::strerror(errno));
    }
    else
    {
        result.coreDumpsDisabled = true;
    }
    return result;
}

SavedTerminal::SavedTerminal() noexcept
    : m_valid(::isatty(STDIN_FILENO) != 0 && ::tcgetattr(STDIN_FILENO, &m_saved) == 0)
{
}

void SavedTerminal::restore() const noexcept
{
    if (m_valid)
    {
        (void)::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
    }
}

keyward::security::SecureString readPassword(const std::string& prompt, std::istream& in, std::ostream& out)
{
    out << prompt << std::flush;

    std::string line;
    {
        const bool fromTerminal{ &in == &std::cin };
        std::optional<EchoGuard> echo{};
        if (fromTerminal)
        {
            echo.emplace();
        }
        std::getline(in, line);
        if (echo && echo->active())
        {
            out << "\n";
        }
    }

    auto sec = keyward::security::secureStringFrom(line);
    keyward::security::secureWipe(std::span<char>{ line.data(), line.size() });
    return sec;
}

keyward::security::SecureString readPassword(const std::string& prompt)
{
    return readPassword(prompt, std::cin, std::cout);
}

} // namespace keyward::ui::cli
