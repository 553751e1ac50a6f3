// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/http_error.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "eden_auth.pb.h"
#include "server/sso/sso_client.hpp"
#include "server/wire/proto_json.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <charconv>
#include <chrono>
#include <span>
#include <string>

namespace eden::net {

namespace {
constexpr size_t MAX_HEAD_BYTES = 8192;
constexpr auto READ_TIMEOUT = std::chrono::seconds(5);
constexpr std::string_view VERIFY_PREFIX = "/auth/verify";

void count_status(int status)
{
    auto &c = eden::metrics::http();
    switch (status) {
        case 400:
            eden::metrics::bump(c.bad_requests);
            break;
        case 401:
            eden::metrics::bump(c.unauthorized);
            break;
        case 404:
            eden::metrics::bump(c.not_found);
            break;
        default:
            break;
    }
}
} // namespace

Response error_response(int status, const std::string &reason, const std::string &message)
{
    wire::ErrorBody body;
    body.set_status_code(status);
    body.set_error(reason);
    body.set_message(message);
    return Response::json(status, wire::to_json(body));
}

crypto::ProfileClaims Router::authenticate(const Request &req) const
{
    std::string token;
    if (auto h = req.header("authorization"); h && h->rfind("Bearer ", 0) == 0)
        token = h->substr(7);
    else if (auto c = req.cookie(m_flows.settings().cookie.name))
        token = *c;
    if (token.empty())
        throw unauthorized("Missing authentication");
    try {
        return m_flows.issuer().verify(token);
    } catch (const crypto::TokenError &ex) {
        eden::log::debug("[http] bearer rejected: {}", ex.what());
        throw unauthorized("Invalid token");
    }
}

coro::task<Response> Router::dispatch(Request req)
{
    if (req.method != "GET")
        throw HttpError(405, "Method Not Allowed", "Method Not Allowed");

    const std::string &p = req.path;
    if (p == "/auth/login")
        co_return m_flows.start_login(req);
    if (p == "/auth/login/callback")
        co_return co_await m_flows.login_callback(std::move(req));
    if (p == "/auth/register")
        co_return m_flows.start_register(req);
    if (p == "/auth/register/callback")
        co_return co_await m_flows.register_callback(std::move(req));
    if (p == "/auth/logout")
        co_return m_flows.logout(req);
    if (p == "/auth/scopes")
        co_return co_await m_flows.modify_scopes(std::move(req));
    if (p == "/auth/character") {
        auto claims = authenticate(req);
        co_return co_await m_flows.start_add_character(std::move(req), std::move(claims));
    }
    if (p.rfind(VERIFY_PREFIX, 0) == 0) {
        std::string_view rest = std::string_view(p).substr(VERIFY_PREFIX.size());
        std::optional<int64_t> character_id;
        if (!rest.empty() && rest != "/") {
            if (rest.front() != '/')
                throw not_found("Not Found");
            rest.remove_prefix(1);
            int64_t id = 0;
            auto [end, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), id);
            if (ec != std::errc() || end != rest.data() + rest.size() || id <= 0)
                throw bad_request("Invalid request params input");
            character_id = id;
        }
        auto claims = authenticate(req);
        co_return co_await m_flows.verify(std::move(req), std::move(claims), character_id);
    }
    throw not_found("Not Found");
}

coro::task<Response> Router::handle(Request req)
{
    eden::metrics::bump(eden::metrics::http().requests);
    std::string path = req.path;
    try {
        auto r = co_await dispatch(std::move(req));
        co_return r;
    } catch (const HttpError &ex) {
        count_status(ex.status());
        eden::log::debug("[http] {} -> {} {}", path, ex.status(), ex.what());
        co_return error_response(ex.status(), ex.reason(), ex.what());
    } catch (const sso::UpstreamError &ex) {
        eden::metrics::bump(eden::metrics::http().upstream_failures);
        eden::log::error("[http] {} upstream failure: {}", path, ex.what());
    } catch (const std::exception &ex) {
        eden::metrics::bump(eden::metrics::http().internal_errors);
        eden::log::error("[http] {} failed: {}", path, ex.what());
    }
    co_return error_response(500, "Internal Server Error", "An internal server error occurred");
}

// Helper: send all bytes of buffer.
static coro::task<void> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return;
    }
}

static coro::task<void> connection(
    std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client, Router &router)
{
    co_await scheduler->schedule();
    std::string head;
    while (head.find("\r\n\r\n") == std::string::npos) {
        if (head.size() > MAX_HEAD_BYTES) {
            auto out = serialize(error_response(400, "Bad Request", "Request header too large"));
            co_await send_all(client, std::span<const char>(out.data(), out.size()));
            co_return;
        }
        auto pstat = co_await client.poll(coro::poll_op::read, READ_TIMEOUT);
        if (pstat != coro::poll_status::event)
            co_return;
        std::string tmp(1024, '\0');
        auto [rstatus, span] = client.recv(tmp);
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok)
            co_return;
        head.append(span.data(), span.size());
    }

    auto req = parse_request(head);
    Response resp = req ? co_await router.handle(std::move(*req))
                        : error_response(400, "Bad Request", "Malformed request");
    if (!req)
        eden::metrics::bump(eden::metrics::http().bad_requests);
    auto out = serialize(resp);
    co_await send_all(client, std::span<const char>(out.data(), out.size()));
}

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, Router &router)
{
    co_await scheduler->schedule();
    eden::log::info("[http] listening on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(connection(scheduler, std::move(client), router));
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            eden::log::error("[http] server poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

} // namespace eden::net
