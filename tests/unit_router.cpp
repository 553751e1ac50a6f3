// SPDX-License-Identifier: Apache-2.0
#include "test_fixtures.hpp"

#include "eden_auth.pb.h"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/wire/proto_json.hpp"

#include <iostream>

using namespace eden;
using namespace eden::testing;

static const std::string TITLES = "esi-characters.read_titles.v1";
static const std::string ROLES = "esi-characters.read_corporation_roles.v1";

static wire::ErrorBody error_of(const net::Response &r)
{
    wire::ErrorBody body;
    assert(r.content_type.rfind("application/json", 0) == 0);
    assert(wire::from_json(r.body, body));
    return body;
}

int main()
{
    FlowHarness h;
    net::Router router(*h.flows);
    auto account = h.seed_character(8001, "Router", TITLES + " " + ROLES);
    auto jwt = h.flows->issuer().issue(HOST, account, 8001);

    auto missing = coro::sync_wait(router.handle(get("/nope")));
    assert(missing.status == 404 && error_of(missing).status_code() == 404);

    auto post = get("/auth/login");
    post.method = "POST";
    assert(coro::sync_wait(router.handle(post)).status == 405);

    // Client error rendering.
    auto bad = coro::sync_wait(router.handle(get("/auth/login", {{"response_type", "token"}})));
    assert(bad.status == 400);
    auto body = error_of(bad);
    assert(body.status_code() == 400 && body.error() == "Bad Request");
    assert(body.message() == "Invalid Request, redirect_to parameter is required.");

    // Bearer required and verified.
    auto anon = coro::sync_wait(router.handle(get("/auth/character", {{"redirect_to", "/x"}})));
    assert(anon.status == 401 && error_of(anon).error() == "Unauthorized");
    auto forged_req = get("/auth/character", {{"redirect_to", "/x"}});
    forged_req.headers["authorization"] = "Bearer " + jwt + "x";
    assert(coro::sync_wait(router.handle(forged_req)).status == 401);

    auto header_req = get("/auth/verify/8001", {{"scopes", TITLES}});
    header_req.headers["authorization"] = "Bearer " + jwt;
    auto via_header = coro::sync_wait(router.handle(header_req));
    assert(via_header.status == 200);

    auto cookie_req = get("/auth/verify", {{"scopes", TITLES}});
    cookie_req.cookies["profile_jwt"] = jwt;
    assert(coro::sync_wait(router.handle(cookie_req)).status == 200);

    auto bad_id = get("/auth/verify/abc", {{"scopes", TITLES}});
    bad_id.headers["authorization"] = "Bearer " + jwt;
    assert(coro::sync_wait(router.handle(bad_id)).status == 400);
    auto bad_suffix = get("/auth/verifyx", {{"scopes", TITLES}});
    assert(coro::sync_wait(router.handle(bad_suffix)).status == 404);

    auto add_req = get("/auth/character", {{"redirect_to", "/x"}});
    add_req.headers["authorization"] = "Bearer " + jwt;
    auto add = coro::sync_wait(router.handle(add_req));
    assert(add.status == 302 && starts_with(add.location, "https://sso.test/oauth/authorize/?"));

    // Provider failure becomes a generic 500.
    auto login = coro::sync_wait(router.handle(
        get("/auth/login", {{"redirect_to", "/x"}, {"response_type", "token"}, {"scopes", TITLES}})));
    auto state = query_value(login.location, "state");
    auto upstream = coro::sync_wait(router.handle(get("/auth/login/callback", {{"code", "unknown"}, {"state", state}})));
    assert(upstream.status == 500 && error_of(upstream).status_code() == 500);

    auto out = coro::sync_wait(router.handle(get("/auth/logout", {{"redirect_to", "https://app.new-eden.io/"}})));
    assert(out.status == 302 && out.location == "https://app.new-eden.io/");
    assert(out.set_cookies.size() == 1 && starts_with(out.set_cookies[0], "profile_jwt=; Max-Age=0"));

    auto metrics = net::render_metrics();
    assert(metrics.find("eden_http_requests_total ") != std::string::npos);
    assert(metrics.find("eden_upstream_failures_total 1") != std::string::npos);
    assert(metrics.find("eden_login_started_total 1") != std::string::npos);

    std::cout << "unit_router OK" << std::endl;
    return 0;
}
