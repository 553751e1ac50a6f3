// SPDX-License-Identifier: Apache-2.0
// records.hpp
// Durable records owned by the identity directory (characters/{id}, users/{accountId}) and the
// directory's user accounts.
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace eden::directory {

struct SsoGrant
{
    std::string access_token;
    std::string refresh_token;
    int64_t expires_at_ms{0}; // epoch milliseconds
    std::string scope; // space separated

    bool operator==(const SsoGrant &) const = default;
};

struct CharacterRecord
{
    int64_t id{0};
    std::string account_id;
    std::string name;
    std::string owner_hash;
    std::optional<SsoGrant> sso;

    bool operator==(const CharacterRecord &) const = default;
};

struct ProfileRecord
{
    std::string id;
    int64_t main_character_id{0};
    std::string name;
    bool errors{false};

    bool operator==(const ProfileRecord &) const = default;
};

struct UserRecord
{
    std::string uid;
    std::string display_name;
    std::string photo_url;
    bool disabled{false};

    bool operator==(const UserRecord &) const = default;
};

} // namespace eden::directory
