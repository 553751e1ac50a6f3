// SPDX-License-Identifier: Apache-2.0
#include "server/directory/memory_directory.hpp"

#include "common/logger.hpp"
#include "server/crypto/base64url.hpp"

#include <openssl/rand.h>

#include <stdexcept>

namespace eden::directory {

void MemoryDirectory::check_writable() const
{
    if (m_fail_writes.load(std::memory_order_relaxed))
        throw std::runtime_error("directory unavailable");
}

coro::task<std::optional<CharacterRecord>> MemoryDirectory::get_character(int64_t character_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_characters.find(character_id);
    if (it == m_characters.end())
        co_return std::nullopt;
    co_return it->second;
}

coro::task<void> MemoryDirectory::put_character(CharacterRecord character)
{
    check_writable();
    std::scoped_lock lk{m_mutex};
    eden::log::debug("[directory] put characters/{} account={}", character.id, character.account_id);
    m_characters[character.id] = std::move(character);
    co_return;
}

coro::task<void> MemoryDirectory::set_character_grant(int64_t character_id, SsoGrant grant)
{
    check_writable();
    std::scoped_lock lk{m_mutex};
    auto it = m_characters.find(character_id);
    if (it == m_characters.end()) {
        // A child write creates the parent node, exactly like a tree-structured store would.
        CharacterRecord c;
        c.id = character_id;
        it = m_characters.emplace(character_id, std::move(c)).first;
    }
    it->second.sso = std::move(grant);
    co_return;
}

coro::task<std::optional<ProfileRecord>> MemoryDirectory::get_profile(std::string account_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_profiles.find(account_id);
    if (it == m_profiles.end())
        co_return std::nullopt;
    co_return it->second;
}

coro::task<void> MemoryDirectory::put_profile(ProfileRecord profile)
{
    check_writable();
    std::scoped_lock lk{m_mutex};
    eden::log::debug("[directory] put users/{} main={}", profile.id, profile.main_character_id);
    m_profiles[profile.id] = std::move(profile);
    co_return;
}

std::string MemoryDirectory::generate_key()
{
    return generate_push_id();
}

size_t MemoryDirectory::character_count()
{
    std::scoped_lock lk{m_mutex};
    return m_characters.size();
}

size_t MemoryDirectory::profile_count()
{
    std::scoped_lock lk{m_mutex};
    return m_profiles.size();
}

coro::task<UserRecord> MemoryUserAccounts::upsert_user(UserRecord user)
{
    std::scoped_lock lk{m_mutex};
    auto [it, created] = m_users.try_emplace(user.uid, user);
    if (!created)
        it->second = std::move(user);
    co_return it->second;
}

coro::task<std::string> MemoryUserAccounts::create_custom_token(std::string uid)
{
    unsigned char raw[32];
    if (RAND_bytes(raw, sizeof(raw)) != 1)
        throw std::runtime_error("RAND_bytes failed");
    std::string token = eden::crypto::base64url_encode(std::string_view(reinterpret_cast<const char *>(raw), sizeof(raw)));
    auto now = std::chrono::steady_clock::now();
    std::scoped_lock lk{m_mutex};
    std::erase_if(m_custom_tokens, [now](const auto &entry) { return entry.second.expires_at <= now; });
    m_custom_tokens[token] = CustomToken{std::move(uid), now + m_token_ttl};
    co_return token;
}

std::optional<UserRecord> MemoryUserAccounts::find_user(const std::string &uid)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_users.find(uid);
    if (it == m_users.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::string> MemoryUserAccounts::uid_for_token(const std::string &token)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_custom_tokens.find(token);
    if (it == m_custom_tokens.end() || it->second.expires_at <= std::chrono::steady_clock::now())
        return std::nullopt;
    return it->second.uid;
}

size_t MemoryUserAccounts::user_count()
{
    std::scoped_lock lk{m_mutex};
    return m_users.size();
}

size_t MemoryUserAccounts::custom_token_count()
{
    std::scoped_lock lk{m_mutex};
    return m_custom_tokens.size();
}

} // namespace eden::directory
