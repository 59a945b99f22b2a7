#include "keyward/storage/posix/PosixFileRepositoryFactory.hpp"
#include "keyward/security/SecureRandom.hpp"
#include "keyward/storage/StorageErrors.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#else
#error Unsupported platform
#endif

namespace keyward::storage::posix
{
namespace
{

constexpr mode_t g_fileMode{ S_IRUSR | S_IWUSR };
constexpr std::string_view g_backupDirName{ "backups" };
constexpr std::string_view g_vaultExtension{ ".vault" };

[[noreturn]] void throwErrno(const char* what)
{
    throw std::system_error(errno, std::generic_category(), what);
}

class FileDescriptor final
{
public:
    explicit FileDescriptor(int fd) noexcept : m_fd{ fd }
    {
    }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&&) = delete;
    FileDescriptor& operator=(FileDescriptor&&) = delete;
    ~FileDescriptor() noexcept
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    // Surfaces close() failures, which can carry deferred write errors.
    void close()
    {
        const int fd{ m_fd };
        m_fd = -1;
        if (::close(fd) != 0)
        {
            throwErrno("storage: close failed");
        }
    }

private:
    int m_fd{ -1 };
};

void writeAll(int fd, std::span<const std::uint8_t> bytes)
{
    std::size_t written{};
    while (written < bytes.size())
    {
        const ssize_t n{ ::write(fd, bytes.data() + written, bytes.size() - written) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throwErrno("storage: write failed");
        }
        written += static_cast<std::size_t>(n);
    }
}

void syncDirectory(const std::filesystem::path& dir)
{
    FileDescriptor fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (fd.get() < 0)
    {
        throwErrno("storage: open directory failed");
    }
    if (::fsync(fd.get()) != 0)
    {
        throwErrno("storage: fsync directory failed");
    }
    fd.close();
}

void ensurePrivateDirectory(const std::filesystem::path& dir)
{
    if (dir.empty())
    {
        return;
    }
    std::error_code ec{};
    if (std::filesystem::is_directory(dir, ec))
    {
        return;
    }
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        throw std::filesystem::filesystem_error("storage: failed to create directory", dir, ec);
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw std::filesystem::filesystem_error("storage: failed to restrict directory", dir, ec);
    }
}

[[nodiscard]] std::string randomToken()
{
    constexpr char kHex[] = "0123456789abcdef";
    std::array<std::uint8_t, 8> rnd{};
    if (!keyward::security::secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        throw std::runtime_error("storage: CSPRNG failure");
    }
    std::string out{};
    for (const std::uint8_t b : rnd)
    {
        out.push_back(kHex[b >> 4U]);
        out.push_back(kHex[b & 0x0FU]);
    }
    return out;
}

[[nodiscard]] std::filesystem::path backupDirFor(const std::filesystem::path& target)
{
    return target.parent_path() / g_backupDirName;
}

[[nodiscard]] std::string backupPrefixFor(const std::filesystem::path& target)
{
    return target.stem().string() + "-";
}

// Millisecond stamp of <prefix><digits>.vault; nullopt for anything else, including stamps that do
// not fit in 64 bits.
[[nodiscard]] std::optional<std::uint64_t> backupStampOf(const std::filesystem::path& candidate,
                                                         const std::string& prefix)
{
    constexpr std::size_t kMaxStampDigits{ 19U };

    const std::string name{ candidate.filename().string() };
    if (name.size() <= prefix.size() + g_vaultExtension.size() || name.rfind(prefix, 0) != 0 ||
        candidate.extension() != g_vaultExtension)
    {
        return std::nullopt;
    }
    const std::string_view stamp{ std::string_view{ name }.substr(
        prefix.size(), name.size() - prefix.size() - g_vaultExtension.size()) };
    if (stamp.size() > kMaxStampDigits ||
        !std::all_of(stamp.begin(), stamp.end(), [](char c) { return c >= '0' && c <= '9'; }))
    {
        return std::nullopt;
    }

    std::uint64_t value{};
    const auto [end, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), value);
    if (ec != std::errc{} || end != stamp.data() + stamp.size())
    {
        return std::nullopt;
    }
    return value;
}

class PosixFileRepository final : public keyward::storage::IVaultFileRepository
{
public:
    [[nodiscard]] bool exists(const std::filesystem::path& target) const override
    {
        std::error_code ec{};
        const bool found{ std::filesystem::is_regular_file(target, ec) };
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw std::filesystem::filesystem_error("storage: stat failed", target, ec);
        }
        return found;
    }

    [[nodiscard]] std::vector<std::uint8_t> readFile(const std::filesystem::path& target) const override
    {
        FileDescriptor fd{ ::open(target.c_str(), O_RDONLY | O_CLOEXEC) };
        if (fd.get() < 0)
        {
            if (errno == ENOENT)
            {
                throw keyward::storage::VaultNotFound("storage: vault file not found");
            }
            throwErrno("storage: open for reading failed");
        }

        std::vector<std::uint8_t> out{};
        std::array<std::uint8_t, 4096> chunk{};
        for (;;)
        {
            const ssize_t n{ ::read(fd.get(), chunk.data(), chunk.size()) };
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throwErrno("storage: read failed");
            }
            if (n == 0)
            {
                break;
            }
            out.insert(out.end(), chunk.begin(), chunk.begin() + n);
        }
        return out;
    }

    [[nodiscard]] keyward::storage::FileStat stat(const std::filesystem::path& target) const override
    {
        std::error_code ec{};
        const auto status{ std::filesystem::status(target, ec) };
        if (ec || !std::filesystem::is_regular_file(status))
        {
            throw keyward::storage::VaultNotFound("storage: vault file not found");
        }
        keyward::storage::FileStat out{};
        out.sizeBytes = std::filesystem::file_size(target);
        out.modified = std::filesystem::last_write_time(target);
        out.permissions = status.permissions();
        return out;
    }

    [[nodiscard]] std::filesystem::path writeTemp(const std::filesystem::path& target,
                                                  std::span<const std::uint8_t> bytes) override
    {
        ensurePrivateDirectory(target.parent_path());

        const std::filesystem::path temp{ target.parent_path() /
                                          ("." + target.filename().string() + ".tmp-" + randomToken()) };
        FileDescriptor fd{ ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, g_fileMode) };
        if (fd.get() < 0)
        {
            throwErrno("storage: create temp file failed");
        }

        try
        {
            // The umask can only clear bits, but be explicit about the final mode.
            if (::fchmod(fd.get(), g_fileMode) != 0)
            {
                throwErrno("storage: fchmod failed");
            }
            writeAll(fd.get(), bytes);
            if (::fsync(fd.get()) != 0)
            {
                throwErrno("storage: fsync failed");
            }
            fd.close();
        }
        catch (const std::exception&)
        {
            discard(temp);
            throw;
        }
        return temp;
    }

    void commit(const std::filesystem::path& temp, const std::filesystem::path& target) override
    {
        if (::rename(temp.c_str(), target.c_str()) != 0)
        {
            throwErrno("storage: rename failed");
        }
        syncDirectory(target.parent_path().empty() ? std::filesystem::path{ "." } : target.parent_path());
    }

    void discard(const std::filesystem::path& temp) noexcept override
    {
        (void)::unlink(temp.c_str());
    }

    std::filesystem::path backup(const std::filesystem::path& target, std::size_t keep) override
    {
        const auto dir{ backupDirFor(target) };
        ensurePrivateDirectory(dir);

        const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count() };
        std::filesystem::path dest{ dir / (backupPrefixFor(target) + std::to_string(millis) +
                                           std::string{ g_vaultExtension }) };
        // Two saves inside the same millisecond must not overwrite each other.
        for (long long bump{ 1 }; exists(dest); ++bump)
        {
            dest = dir / (backupPrefixFor(target) + std::to_string(millis + bump) + std::string{ g_vaultExtension });
        }

        const auto bytes{ readFile(target) };
        const auto temp{ writeTemp(dest, bytes) };
        try
        {
            commit(temp, dest);
        }
        catch (const std::exception&)
        {
            discard(temp);
            throw;
        }

        auto existing{ listBackups(target) };
        while (existing.size() > keep)
        {
            std::filesystem::remove(existing.front());
            existing.erase(existing.begin());
        }
        return dest;
    }

    [[nodiscard]] std::vector<std::filesystem::path> listBackups(const std::filesystem::path& target) const override
    {
        const auto dir{ backupDirFor(target) };
        std::vector<std::filesystem::path> out{};
        std::error_code ec{};
        if (!std::filesystem::is_directory(dir, ec))
        {
            return out;
        }

        const std::string prefix{ backupPrefixFor(target) };
        std::vector<std::pair<std::uint64_t, std::filesystem::path>> stamped{};
        for (const auto& entry : std::filesystem::directory_iterator{ dir })
        {
            if (!entry.is_regular_file())
            {
                continue;
            }
            if (const auto stamp{ backupStampOf(entry.path(), prefix) })
            {
                stamped.emplace_back(*stamp, entry.path());
            }
        }

        std::sort(stamped.begin(), stamped.end());
        out.reserve(stamped.size());
        for (auto& entry : stamped)
        {
            out.push_back(std::move(entry.second));
        }
        return out;
    }

    void remove(const std::filesystem::path& target) override
    {
        if (!exists(target))
        {
            throw keyward::storage::VaultNotFound("storage: vault file not found");
        }
        for (const auto& b : listBackups(target))
        {
            std::filesystem::remove(b);
        }
        std::filesystem::remove(target);
    }
};

} // namespace

std::unique_ptr<keyward::storage::IVaultFileRepository> makePosixFileRepository()
{
    return std::make_unique<PosixFileRepository>();
}

} // namespace keyward::storage::posix
