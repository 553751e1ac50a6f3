// SPDX-License-Identifier: Apache-2.0
// stub_sso_client.hpp
// In-process identity provider. Authorization codes map to pre-registered identities; with
// accept_numeric_codes a purely numeric code yields a synthetic pilot with that character id.
#pragma once

#include "server/sso/sso_client.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace eden::sso {

class StubSsoClient : public ISsoClient
{
public:
    explicit StubSsoClient(bool accept_numeric_codes = false) : m_accept_numeric(accept_numeric_codes) {}

    // Next exchange of `code` yields `who`; codes are single use.
    void register_code(std::string code, Verification who);

    coro::task<TokenSet> exchange_code(std::string code, ClientProfile client) override;
    coro::task<Verification> introspect(std::string token_type, std::string access_token) override;
    coro::task<void> revoke(std::string access_token, ClientProfile client) override;

    std::vector<std::string> revoked_tokens();
    // Client id used by the most recent exchange.
    std::string last_client_id();

private:
    bool m_accept_numeric;
    std::mutex m_mutex;
    uint64_t m_issued{0};
    std::string m_last_client_id;
    std::unordered_map<std::string, Verification> m_codes;
    std::unordered_map<std::string, Verification> m_tokens; // access token -> identity
    std::vector<std::string> m_revoked;
};

} // namespace eden::sso
