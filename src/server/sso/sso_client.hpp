// SPDX-License-Identifier: Apache-2.0
// sso_client.hpp
// Identity provider (EVE SSO) collaborator: authorization-code exchange, token introspection
// and revocation. Implementations: "http" (libcurl against the real endpoints) and "stub"
// (in-process identities for development and tests).
#pragma once

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace eden::sso {

// Provider call failed (transport error, non-2xx status, unparseable body).
class UpstreamError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// One registered application at the provider (login or register profile).
struct ClientProfile
{
    std::string id;
    std::string secret;
    std::string redirect_uri;
    // Authorization endpoint on the provider, relative to its base url.
    std::string authorize_path{"/oauth/authorize"};
};

struct TokenSet
{
    std::string token_type;
    std::string access_token;
    std::string refresh_token;
    int64_t expires_in{0}; // seconds
};

struct Verification
{
    int64_t character_id{0};
    std::string character_name;
    std::string owner_hash;
    std::string scopes; // space separated
    std::string expires_on;
};

class ISsoClient
{
public:
    virtual ~ISsoClient() = default;
    virtual coro::task<TokenSet> exchange_code(std::string code, ClientProfile client) = 0;
    virtual coro::task<Verification> introspect(std::string token_type, std::string access_token) = 0;
    virtual coro::task<void> revoke(std::string access_token, ClientProfile client) = 0;
};

// mode: "http" or "stub". Throws std::invalid_argument for anything else.
std::unique_ptr<ISsoClient> make_sso_client(
    const std::string &mode, const std::string &base_url, std::shared_ptr<coro::io_scheduler> scheduler);

} // namespace eden::sso
