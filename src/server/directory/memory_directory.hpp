// SPDX-License-Identifier: Apache-2.0
// memory_directory.hpp
// Process-local directory and user-account store (development mode and tests).
#pragma once

#include "server/directory/directory.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace eden::directory {

class MemoryDirectory : public IDirectory
{
public:
    coro::task<std::optional<CharacterRecord>> get_character(int64_t character_id) override;
    coro::task<void> put_character(CharacterRecord character) override;
    coro::task<void> set_character_grant(int64_t character_id, SsoGrant grant) override;
    coro::task<std::optional<ProfileRecord>> get_profile(std::string account_id) override;
    coro::task<void> put_profile(ProfileRecord profile) override;
    std::string generate_key() override;

    // When set, every write throws (simulates an unreachable backend).
    void set_fail_writes(bool fail) noexcept { m_fail_writes.store(fail, std::memory_order_relaxed); }

    size_t character_count();
    size_t profile_count();

private:
    void check_writable() const;

    std::mutex m_mutex;
    std::map<int64_t, CharacterRecord> m_characters;
    std::unordered_map<std::string, ProfileRecord> m_profiles;
    std::atomic<bool> m_fail_writes{false};
};

// Custom tokens expire after `token_ttl`; expired entries are pruned on every insert.
class MemoryUserAccounts : public IUserAccounts
{
public:
    explicit MemoryUserAccounts(std::chrono::seconds token_ttl = std::chrono::hours(1)) : m_token_ttl(token_ttl) {}

    coro::task<UserRecord> upsert_user(UserRecord user) override;
    coro::task<std::string> create_custom_token(std::string uid) override;

    std::optional<UserRecord> find_user(const std::string &uid);
    // uid the custom token was minted for, if it exists and has not expired.
    std::optional<std::string> uid_for_token(const std::string &token);
    size_t user_count();
    size_t custom_token_count();

private:
    struct CustomToken
    {
        std::string uid;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::chrono::seconds m_token_ttl;
    std::mutex m_mutex;
    std::unordered_map<std::string, UserRecord> m_users;
    std::unordered_map<std::string, CustomToken> m_custom_tokens;
};

} // namespace eden::directory
