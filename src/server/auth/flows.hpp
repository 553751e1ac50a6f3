// SPDX-License-Identifier: Apache-2.0
// flows.hpp
// Login / register / add-character / modify-scopes flows, their provider callbacks, logout and
// the verify check. Entry handlers encrypt a FlowState into the provider's `state` parameter;
// callbacks decrypt it and decide between delivering a session artifact and redirecting into a
// re-authorization request.
//
// Client errors are thrown as eden::HttpError (400/401). Collaborator failures propagate
// unchanged; nothing is retried and partially applied directory writes are not rolled back.
#pragma once

#include "server/auth/delivery.hpp"
#include "server/auth/flow_state.hpp"
#include "server/crypto/session_token.hpp"
#include "server/crypto/state_codec.hpp"
#include "server/directory/directory.hpp"
#include "server/net/http.hpp"
#include "server/sso/sso_client.hpp"

#include <coro/coro.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace eden::auth {

struct FlowSettings
{
    std::string sso_base_url{"https://login.eveonline.com"};
    // SPA page that renders character_not_found / missing_scopes prompts.
    std::string accounts_origin{"https://accounts.new-eden.io"};
    // Path of the register entry endpoint, target of the modify-scopes hop.
    std::string register_path{"/auth/register"};
    sso::ClientProfile login_client;
    sso::ClientProfile register_client{"", "", "", "/oauth/authorize/"};
    CookieSettings cookie;
};

// Code exchange + introspection result.
struct IdentityAssertion
{
    int64_t character_id{0};
    std::string character_name;
    std::string owner_hash;
    std::string access_token;
    std::string refresh_token;
    int64_t expires_in{0};
    std::string granted_scopes; // space separated
};

class AuthFlows
{
public:
    AuthFlows(
        FlowSettings settings,
        crypto::StateCodec codec,
        crypto::SessionTokenIssuer issuer,
        sso::ISsoClient &sso,
        directory::IDirectory &directory,
        directory::IUserAccounts &users);

    // GET /auth/login?redirect_to&response_type&scopes
    net::Response start_login(const net::Request &req) const;
    // GET /auth/register?redirect_to&response_type[&scopes]
    net::Response start_register(const net::Request &req) const;
    // GET /auth/logout?redirect_to
    net::Response logout(const net::Request &req) const;

    // GET /auth/character?redirect_to[&scopes], authenticated
    coro::task<net::Response> start_add_character(net::Request req, crypto::ProfileClaims bearer);
    // GET /auth/scopes?redirect_to&state
    coro::task<net::Response> modify_scopes(net::Request req);

    // GET /auth/login/callback?code&state
    coro::task<net::Response> login_callback(net::Request req);
    // GET /auth/register/callback?code&state (register and add-character)
    coro::task<net::Response> register_callback(net::Request req);

    // GET /auth/verify[/<characterId>]?scopes, authenticated
    coro::task<net::Response> verify(net::Request req, crypto::ProfileClaims bearer, std::optional<int64_t> character_id);

    const crypto::SessionTokenIssuer &issuer() const noexcept { return m_issuer; }
    const crypto::StateCodec &codec() const noexcept { return m_codec; }
    const FlowSettings &settings() const noexcept { return m_settings; }

private:
    FlowState decode_state(const std::optional<std::string> &token) const;
    std::string authorize_url(const sso::ClientProfile &client, const FlowState &state, const ScopeList *scopes) const;
    std::string character_not_found_url(const std::string &redirect, const ScopeList &scopes) const;
    std::string missing_scopes_url(const std::string &name, const std::string &redirect, const std::string &state) const;

    coro::task<IdentityAssertion> assert_identity(std::string code, sso::ClientProfile client);
    coro::task<net::Response> link_new_character(FlowState state, IdentityAssertion identity);

    FlowSettings m_settings;
    crypto::StateCodec m_codec;
    crypto::SessionTokenIssuer m_issuer;
    sso::ISsoClient &m_sso;
    directory::IDirectory &m_directory;
    directory::IUserAccounts &m_users;
};

// Grant stored on the character; expiry is shortened by a minute to refresh ahead of the provider.
directory::SsoGrant make_grant(const IdentityAssertion &identity, int64_t now_ms);
directory::CharacterRecord make_character(const IdentityAssertion &identity, std::string account_id, int64_t now_ms);

} // namespace eden::auth
