#ifndef INCLUDE_KEYWARD_STORAGE_IVAULTFILEREPOSITORY_HPP
#define INCLUDE_KEYWARD_STORAGE_IVAULTFILEREPOSITORY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace keyward::storage
{

struct FileStat final
{
    std::uintmax_t sizeBytes{};
    std::filesystem::file_time_type modified{};
    std::filesystem::perms permissions{ std::filesystem::perms::none };
};

// File operations behind the vault store. Writes are split into writeTemp and commit so that a
// replacement becomes visible only through the rename in commit.
//
// Errors: VaultNotFound when a file that must exist does not; std::system_error or
// std::filesystem::filesystem_error for everything else.
class IVaultFileRepository
{
public:
    IVaultFileRepository() = default;
    IVaultFileRepository(const IVaultFileRepository&) = delete;
    IVaultFileRepository& operator=(const IVaultFileRepository&) = delete;
    IVaultFileRepository(IVaultFileRepository&&) = delete;
    IVaultFileRepository& operator=(IVaultFileRepository&&) = delete;
    virtual ~IVaultFileRepository() = default;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& target) const = 0;

    [[nodiscard]] virtual std::vector<std::uint8_t> readFile(const std::filesystem::path& target) const = 0;

    [[nodiscard]] virtual FileStat stat(const std::filesystem::path& target) const = 0;

    // Creates a fresh owner-only (0600) file in target's directory, writes and syncs the bytes.
    // Creates the directory (0700) if needed. Returns the temporary path.
    [[nodiscard]] virtual std::filesystem::path writeTemp(const std::filesystem::path& target,
                                                          std::span<const std::uint8_t> bytes) = 0;

    // Atomically renames temp over target and syncs the directory.
    virtual void commit(const std::filesystem::path& temp, const std::filesystem::path& target) = 0;

    // Best-effort removal of an uncommitted temporary file.
    virtual void discard(const std::filesystem::path& temp) noexcept = 0;

    // Copies target into <dir>/backups/<stem>-<unix-ms>.vault (0600), then keeps only the newest `keep` copies.
    // Returns the new backup path.
    virtual std::filesystem::path backup(const std::filesystem::path& target, std::size_t keep) = 0;

    // Oldest first.
    [[nodiscard]] virtual std::vector<std::filesystem::path> listBackups(const std::filesystem::path& target) const = 0;

    // Deletes target and all of its backups. Throws VaultNotFound if target does not exist.
    virtual void remove(const std::filesystem::path& target) = 0;
};

} // namespace keyward::storage

#endif // INCLUDE_KEYWARD_STORAGE_IVAULTFILEREPOSITORY_HPP
