#ifndef INCLUDE_KEYWARD_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_KEYWARD_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace keyward::storage
{

class VaultNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace keyward::storage

#endif // INCLUDE_KEYWARD_STORAGE_STORAGEERRORS_HPP
