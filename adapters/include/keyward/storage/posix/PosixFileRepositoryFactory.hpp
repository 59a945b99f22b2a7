#ifndef INCLUDE_KEYWARD_STORAGE_POSIX_POSIXFILEREPOSITORYFACTORY_HPP
#define INCLUDE_KEYWARD_STORAGE_POSIX_POSIXFILEREPOSITORYFACTORY_HPP

#include "keyward/storage/IVaultFileRepository.hpp"
#include <memory>

namespace keyward::storage::posix
{

[[nodiscard]] std::unique_ptr<keyward::storage::IVaultFileRepository> makePosixFileRepository();

} // namespace keyward::storage::posix

#endif // INCLUDE_KEYWARD_STORAGE_POSIX_POSIXFILEREPOSITORYFACTORY_HPP
