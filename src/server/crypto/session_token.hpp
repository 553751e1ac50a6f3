// SPDX-License-Identifier: Apache-2.0
// session_token.hpp
// Profile session artifact: HS256 JWT (jwt-cpp) with claims {iss, sub="profile", aud, accountId, mainId}.
// No exp/iat claims; rotating the secret is the only way to invalidate issued tokens.
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eden::crypto {

class TokenError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ProfileClaims
{
    std::string issuer;
    std::string subject;
    std::string audience;
    std::string account_id;
    int64_t main_character_id{0};
};

class SessionTokenIssuer
{
public:
    static constexpr const char *SUBJECT = "profile";

    // Throws std::invalid_argument for an empty secret.
    SessionTokenIssuer(std::string secret, std::string issuer);

    std::string issue(std::string_view audience, std::string_view account_id, int64_t main_character_id) const;

    // Checks structure, algorithm, signature, issuer and subject. Audience is left to the caller.
    ProfileClaims verify(std::string_view token) const;

    const std::string &issuer() const noexcept { return m_issuer; }

private:
    std::string m_secret;
    std::string m_issuer;
};

} // namespace eden::crypto
