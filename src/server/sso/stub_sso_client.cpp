// SPDX-License-Identifier: Apache-2.0
#include "server/sso/stub_sso_client.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cctype>

namespace eden::sso {

namespace {
bool all_digits(const std::string &s)
{
    return !s.empty() && s.size() < 19
        && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}
} // namespace

void StubSsoClient::register_code(std::string code, Verification who)
{
    std::scoped_lock lk{m_mutex};
    m_codes[std::move(code)] = std::move(who);
}

coro::task<TokenSet> StubSsoClient::exchange_code(std::string code, ClientProfile client)
{
    std::scoped_lock lk{m_mutex};
    m_last_client_id = client.id;
    Verification who;
    auto it = m_codes.find(code);
    if (it != m_codes.end()) {
        who = std::move(it->second);
        m_codes.erase(it);
    } else if (m_accept_numeric && all_digits(code)) {
        who.character_id = std::stoll(code);
        who.character_name = "Pilot " + code;
        who.owner_hash = "stub-owner-" + code;
        who.scopes = "esi-characters.read_titles.v1 esi-characters.read_corporation_roles.v1";
    } else {
        throw UpstreamError("sso token exchange failed: invalid_grant");
    }
    TokenSet tokens;
    tokens.token_type = "Bearer";
    tokens.access_token = "stub-at-" + std::to_string(++m_issued) + "-" + std::to_string(who.character_id);
    tokens.refresh_token = "stub-rt-" + std::to_string(m_issued);
    tokens.expires_in = 1200;
    m_tokens[tokens.access_token] = std::move(who);
    eden::log::debug("[sso] stub exchange client={} token={}", client.id, eden::log::redact(tokens.access_token));
    co_return tokens;
}

coro::task<Verification> StubSsoClient::introspect(std::string token_type, std::string access_token)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_tokens.find(access_token);
    if (token_type != "Bearer" || it == m_tokens.end())
        throw UpstreamError("sso verify failed: invalid_token");
    co_return it->second;
}

coro::task<void> StubSsoClient::revoke(std::string access_token, ClientProfile client)
{
    std::scoped_lock lk{m_mutex};
    eden::log::debug("[sso] stub revoke client={} token={}", client.id, eden::log::redact(access_token));
    m_tokens.erase(access_token);
    m_revoked.push_back(std::move(access_token));
    co_return;
}

std::vector<std::string> StubSsoClient::revoked_tokens()
{
    std::scoped_lock lk{m_mutex};
    return m_revoked;
}

std::string StubSsoClient::last_client_id()
{
    std::scoped_lock lk{m_mutex};
    return m_last_client_id;
}

} // namespace eden::sso
