// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/auth/flows.hpp"
#include "server/net/http.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace eden::net {

// Maps GET routes onto the auth flows and renders failures:
// HttpError -> its status, TokenError -> 401, anything else -> logged 500.
class Router
{
public:
    explicit Router(auth::AuthFlows &flows) : m_flows(flows) {}

    // Never throws; every outcome is a response.
    coro::task<Response> handle(Request req);

private:
    coro::task<Response> dispatch(Request req);
    // Bearer from "Authorization: Bearer" or the session cookie, verified and audience-free.
    crypto::ProfileClaims authenticate(const Request &req) const;

    auth::AuthFlows &m_flows;
};

Response error_response(int status, const std::string &reason, const std::string &message);

// Starts the TCP accept loop on the given port. One request per connection.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, Router &router);

} // namespace eden::net
