#ifndef KEYWARD_UI_CLI_CONSOLEUTILS_HPP
#define KEYWARD_UI_CLI_CONSOLEUTILS_HPP

#include "keyward/security/SecureMemory.hpp"
#include <iosfwd>
#include <string>

#include <sys/resource.h>
#include <termios.h>

namespace keyward::ui::cli
{

enum class MemoryLock
{
    None,        // nothing pinned
    CurrentOnly, // pages mapped at call time; later allocations may be swapped
    All          // current and future pages
};

struct ProcessHardening
{
    MemoryLock memory{ MemoryLock::None };
    bool coreDumpsDisabled{ false };
};

// Future pages are pinned only under an unlimited RLIMIT_MEMLOCK. A finite limit would make large
// allocations such as the KDF work area fail once the pinned total reaches it.
[[nodiscard]] MemoryLock chooseMemoryLock(rlim_t memlockLimit) noexcept;

// Pins process memory as chooseMemoryLock allows and disables core dumps.
[[nodiscard]] ProcessHardening hardenProcess() noexcept;

// Snapshot of the stdin terminal settings taken at construction. restore() may run on any thread,
// which lets a signal handler undo a prompt's disabled echo.
class SavedTerminal final
{
public:
    SavedTerminal() noexcept;

    void restore() const noexcept;

private:
    struct termios m_saved
    {
    };
    bool m_valid{ false };
};

// Prompts on `out` and reads one line from `in`. Echo is turned off while reading when `in` is a terminal.
[[nodiscard]] keyward::security::SecureString readPassword(const std::string& prompt, std::istream& in,
                                                           std::ostream& out);

[[nodiscard]] keyward::security::SecureString readPassword(const std::string& prompt);

} // namespace keyward::ui::cli

#endif // KEYWARD_UI_CLI_CONSOLEUTILS_HPP
