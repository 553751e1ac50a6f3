// SPDX-License-Identifier: Apache-2.0
// directory.hpp
// Collaborator seams for the identity directory (characters/{id}, users/{accountId}) and the
// directory's user-account service. Every call may suspend; failures surface as exceptions.
#pragma once

#include "server/directory/records.hpp"

#include <coro/coro.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace eden::directory {

class IDirectory
{
public:
    virtual ~IDirectory() = default;

    virtual coro::task<std::optional<CharacterRecord>> get_character(int64_t character_id) = 0;
    // Replaces the whole record at characters/{id}.
    virtual coro::task<void> put_character(CharacterRecord character) = 0;
    // Replaces only characters/{id}/sso.
    virtual coro::task<void> set_character_grant(int64_t character_id, SsoGrant grant) = 0;

    virtual coro::task<std::optional<ProfileRecord>> get_profile(std::string account_id) = 0;
    virtual coro::task<void> put_profile(ProfileRecord profile) = 0;

    // New account id; unique and roughly time ordered.
    virtual std::string generate_key() = 0;
};

class IUserAccounts
{
public:
    virtual ~IUserAccounts() = default;

    // Create-or-update keyed by uid; returns the stored record.
    virtual coro::task<UserRecord> upsert_user(UserRecord user) = 0;
    // Short-lived credential the client exchanges with the directory for its own session.
    virtual coro::task<std::string> create_custom_token(std::string uid) = 0;
};

// 20-character push id: 8 chars of millisecond timestamp followed by 12 random chars.
std::string generate_push_id();

// User account record for a character as shown by the directory.
UserRecord make_user_record(int64_t character_id, const std::string &character_name);

} // namespace eden::directory
