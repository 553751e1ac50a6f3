// SPDX-License-Identifier: Apache-2.0
// http_sso_client.hpp
// EVE SSO v1 endpoints over libcurl: POST /oauth/token, GET /oauth/verify, POST /oauth/revoke.
// Requests block, so each call first hops onto the scheduler's worker threads.
#pragma once

#include "server/sso/sso_client.hpp"

#include <string>

namespace eden::sso {

class HttpSsoClient : public ISsoClient
{
public:
    HttpSsoClient(std::string base_url, std::shared_ptr<coro::io_scheduler> scheduler);

    coro::task<TokenSet> exchange_code(std::string code, ClientProfile client) override;
    coro::task<Verification> introspect(std::string token_type, std::string access_token) override;
    coro::task<void> revoke(std::string access_token, ClientProfile client) override;

private:
    std::string m_base_url;
    std::shared_ptr<coro::io_scheduler> m_scheduler;
};

} // namespace eden::sso
