#ifndef INCLUDE_KEYWARD_CORE_ACCOUNT_HPP
#define INCLUDE_KEYWARD_CORE_ACCOUNT_HPP

#include "keyward/security/SecureMemory.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace keyward::core
{

using AccountId = std::uint64_t;

enum class CategoryKind : std::uint8_t
{
    Social = 0U,
    Banking = 1U,
    Work = 2U,
    Personal = 3U,
    Other = 4U,
};

struct Category final
{
    CategoryKind kind{ CategoryKind::Personal };
    // Only meaningful for CategoryKind::Other.
    std::string otherLabel;

    [[nodiscard]] static Category other(std::string label)
    {
        return Category{ .kind = CategoryKind::Other, .otherLabel = std::move(label) };
    }

    friend bool operator==(const Category&, const Category&) = default;
};

// "social", "banking", "work", "personal" (case-insensitive); anything else becomes Other(text).
[[nodiscard]] Category parseCategory(std::string_view text);
[[nodiscard]] std::string categoryName(const Category& category);

using TagSet = std::set<std::string, std::less<>>;

// Input for creating a record.
struct AccountFields final
{
    std::string name;
    Category category{};
    std::optional<std::string> url;
    std::optional<std::string> username;
    keyward::security::SecureString secret;
    std::optional<std::string> notes;
    TagSet tags;
};

// Input for editing a record: unset members are left alone. An empty string clears url, username or notes.
struct AccountPatch final
{
    std::optional<std::string> name;
    std::optional<Category> category;
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<keyward::security::SecureString> secret;
    std::optional<std::string> notes;
    std::optional<TagSet> tags;
};

struct Account final
{
    AccountId id{};
    std::string name;
    Category category{};
    std::optional<std::string> url;
    std::optional<std::string> username;
    keyward::security::SecureString secret;
    std::optional<std::string> notes;
    TagSet tags;
    std::uint64_t createdAtUnixSeconds{};
    std::uint64_t modifiedAtUnixSeconds{};
};

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_ACCOUNT_HPP
