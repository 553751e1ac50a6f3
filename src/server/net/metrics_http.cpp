// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <atomic>
#include <span>
#include <sstream>
#include <string>

namespace eden::net {

namespace {
void counter(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE " << name << " counter\n";
    oss << name << " " << v.load(std::memory_order_relaxed) << "\n";
}
} // namespace

std::string render_metrics()
{
    std::ostringstream oss;
    auto &f = eden::metrics::flows();
    auto &h = eden::metrics::http();
    // Flow entry points
    counter(oss, "eden_login_started_total", f.login_started);
    counter(oss, "eden_register_started_total", f.register_started);
    counter(oss, "eden_add_character_started_total", f.add_character_started);
    counter(oss, "eden_modify_scopes_started_total", f.modify_scopes_started);
    // Callback outcomes
    counter(oss, "eden_sessions_delivered_total", f.sessions_delivered);
    counter(oss, "eden_profiles_created_total", f.profiles_created);
    counter(oss, "eden_characters_linked_total", f.characters_linked);
    counter(oss, "eden_grants_replaced_total", f.grants_replaced);
    counter(oss, "eden_blocked_character_not_found_total", f.blocked_character_not_found);
    counter(oss, "eden_blocked_missing_scopes_total", f.blocked_missing_scopes);
    counter(oss, "eden_verify_ok_total", f.verify_ok);
    // HTTP front end
    counter(oss, "eden_http_requests_total", h.requests);
    counter(oss, "eden_http_bad_requests_total", h.bad_requests);
    counter(oss, "eden_http_unauthorized_total", h.unauthorized);
    counter(oss, "eden_http_not_found_total", h.not_found);
    counter(oss, "eden_http_internal_errors_total", h.internal_errors);
    counter(oss, "eden_upstream_failures_total", h.upstream_failures);
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    // Very small timeout; one-shot request
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event) {
        co_return;
    }
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok && rs != coro::net::recv_status::would_block)
        co_return;
    // naive method/path parse
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? render_metrics() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            out = rest;
            continue;
        }
        break;
    }
    co_return;
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    eden::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                scheduler->spawn(handle_client(scheduler, std::move(client)));
            }
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            eden::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace eden::net
