#include "keyward/core/VaultBody.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>

namespace keyward::core
{
namespace
{

[[nodiscard]] std::string lowered(std::string_view s)
{
    std::string out{};
    out.reserve(s.size());
    for (const char c : s)
    {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

[[nodiscard]] bool isBlank(std::string_view s) noexcept
{
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

[[nodiscard]] bool isValidCategory(const Category& c) noexcept
{
    if (c.kind == CategoryKind::Other)
    {
        return !isBlank(c.otherLabel);
    }
    return c.kind <= CategoryKind::Personal;
}

[[nodiscard]] bool isValidRecord(const Account& a) noexcept
{
    return !isBlank(a.name) && !a.secret.empty() && isValidCategory(a.category);
}

// Empty optional text is stored as "absent".
[[nodiscard]] std::optional<std::string> normalized(std::optional<std::string> text)
{
    if (text.has_value() && text->empty())
    {
        return std::nullopt;
    }
    return text;
}

[[nodiscard]] bool containsFolded(const std::optional<std::string>& haystack, std::string_view needleLower)
{
    return haystack.has_value() && lowered(*haystack).find(needleLower) != std::string::npos;
}

} // namespace

Category parseCategory(std::string_view text)
{
    const std::string key{ lowered(text) };
    if (key == "social")
    {
        return Category{ .kind = CategoryKind::Social };
    }
    if (key == "banking")
    {
        return Category{ .kind = CategoryKind::Banking };
    }
    if (key == "work")
    {
        return Category{ .kind = CategoryKind::Work };
    }
    if (key == "personal")
    {
        return Category{ .kind = CategoryKind::Personal };
    }
    return Category::other(std::string{ text });
}

std::string categoryName(const Category& category)
{
    switch (category.kind)
    {
    case CategoryKind::Social:
        return "Social";
    case CategoryKind::Banking:
        return "Banking";
    case CategoryKind::Work:
        return "Work";
    case CategoryKind::Personal:
        return "Personal";
    case CategoryKind::Other:
        return category.otherLabel;
    }
    return "Unknown";
}

std::uint64_t unixSecondsNow() noexcept
{
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()) };
    return secs.count() < 0 ? 0U : static_cast<std::uint64_t>(secs.count());
}

VaultBody::VaultBody(NowProvider now) : m_now(std::move(now)), m_createdAt{ m_now() }
{
}

std::optional<VaultBody> VaultBody::restore(std::uint64_t createdAtUnixSeconds, AccountId nextId,
                                            VaultSettings settings, std::vector<Account> accounts, NowProvider now)
{
    if (nextId == 0U)
    {
        return std::nullopt;
    }

    std::set<AccountId> seen{};
    for (const auto& a : accounts)
    {
        if (a.id == 0U || a.id >= nextId || !seen.insert(a.id).second || !isValidRecord(a))
        {
            return std::nullopt;
        }
    }

    VaultBody body{ std::move(now) };
    body.m_createdAt = createdAtUnixSeconds;
    body.m_nextId = nextId;
    body.m_settings = settings;
    body.m_accounts = std::move(accounts);
    return body;
}

VaultResult<Account> VaultBody::create(AccountFields fields)
{
    Account account{};
    account.name = std::move(fields.name);
    account.category = std::move(fields.category);
    account.url = normalized(std::move(fields.url));
    account.username = normalized(std::move(fields.username));
    account.secret = std::move(fields.secret);
    account.notes = normalized(std::move(fields.notes));
    account.tags = std::move(fields.tags);

    if (!isValidRecord(account))
    {
        return VaultError::InvalidRecord;
    }
    if (m_nextId == g_maxNextId)
    {
        return VaultError::IdsExhausted;
    }

    account.id = m_nextId++;
    account.createdAtUnixSeconds = m_now();
    account.modifiedAtUnixSeconds = account.createdAtUnixSeconds;
    m_accounts.push_back(account);
    return account;
}

VaultResult<Account> VaultBody::update(AccountId id, AccountPatch patch)
{
    const auto it{ locate(id) };
    if (it == m_accounts.end())
    {
        return VaultError::NotFound;
    }

    Account edited{ *it };
    if (patch.name)
    {
        edited.name = std::move(*patch.name);
    }
    if (patch.category)
    {
        edited.category = std::move(*patch.category);
    }
    if (patch.url)
    {
        edited.url = normalized(std::move(patch.url));
    }
    if (patch.username)
    {
        edited.username = normalized(std::move(patch.username));
    }
    if (patch.secret)
    {
        edited.secret = std::move(*patch.secret);
    }
    if (patch.notes)
    {
        edited.notes = normalized(std::move(patch.notes));
    }
    if (patch.tags)
    {
        edited.tags = std::move(*patch.tags);
    }

    if (!isValidRecord(edited))
    {
        return VaultError::InvalidRecord;
    }

    edited.modifiedAtUnixSeconds = std::max(m_now(), edited.createdAtUnixSeconds);
    *it = edited;
    return edited;
}

bool VaultBody::remove(AccountId id) noexcept
{
    const auto it{ locate(id) };
    if (it == m_accounts.end())
    {
        return false;
    }
    m_accounts.erase(it);
    return true;
}

VaultResult<Account> VaultBody::adopt(const Account& foreign)
{
    if (!isValidRecord(foreign))
    {
        return VaultError::InvalidRecord;
    }
    if (m_nextId == g_maxNextId)
    {
        return VaultError::IdsExhausted;
    }

    Account account{ foreign };
    account.id = m_nextId++;
    m_accounts.push_back(account);
    return account;
}

void VaultBody::clear() noexcept
{
    m_accounts.clear();
}

const Account* VaultBody::find(AccountId id) const noexcept
{
    const auto it{ std::find_if(m_accounts.begin(), m_accounts.end(), [id](const Account& a) { return a.id == id; }) };
    return it == m_accounts.end() ? nullptr : &*it;
}

const std::vector<Account>& VaultBody::accounts() const noexcept
{
    return m_accounts;
}

std::vector<const Account*> VaultBody::select(const AccountFilter& filter) const
{
    const std::string needle{ filter.text ? lowered(*filter.text) : std::string{} };

    std::vector<const Account*> out{};
    for (const auto& a : m_accounts)
    {
        if (filter.category && !(a.category == *filter.category))
        {
            continue;
        }
        if (filter.tag && !a.tags.contains(*filter.tag))
        {
            continue;
        }
        if (!needle.empty())
        {
            const bool hit{ lowered(a.name).find(needle) != std::string::npos || containsFolded(a.url, needle) ||
                            containsFolded(a.username, needle) || containsFolded(a.notes, needle) };
            if (!hit)
            {
                continue;
            }
        }
        out.push_back(&a);
    }
    return out;
}

std::uint32_t VaultBody::schemaVersion() const noexcept
{
    return g_vaultBodySchemaV1;
}

std::uint64_t VaultBody::createdAtUnixSeconds() const noexcept
{
    return m_createdAt;
}

AccountId VaultBody::nextId() const noexcept
{
    return m_nextId;
}

const VaultSettings& VaultBody::settings() const noexcept
{
    return m_settings;
}

void VaultBody::setSettings(VaultSettings settings) noexcept
{
    m_settings = settings;
}

std::vector<Account>::iterator VaultBody::locate(AccountId id) noexcept
{
    return std::find_if(m_accounts.begin(), m_accounts.end(), [id](const Account& a) { return a.id == id; });
}

} // namespace keyward::core
