// SPDX-License-Identifier: Apache-2.0
#include "server/sso/sso_client.hpp"
#include "server/sso/stub_sso_client.hpp"

#include <coro/io_scheduler.hpp>

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace eden::sso;

template <typename T>
static bool upstream_fails(coro::task<T> task)
{
    try {
        coro::sync_wait(std::move(task));
    } catch (const UpstreamError &) {
        return true;
    }
    return false;
}

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    ClientProfile client{"cid", "csecret", "https://api.test/cb"};

    // Stub mode: numeric codes yield synthetic pilots; tokens introspect and revoke.
    auto stub = make_sso_client("stub", "https://unused", sched);
    auto tokens = coro::sync_wait(stub->exchange_code("90000042", client));
    assert(tokens.token_type == "Bearer" && tokens.expires_in == 1200);
    auto who = coro::sync_wait(stub->introspect(tokens.token_type, tokens.access_token));
    assert(who.character_id == 90000042 && who.character_name == "Pilot 90000042");
    coro::sync_wait(stub->revoke(tokens.access_token, client));
    assert(upstream_fails(stub->introspect(tokens.token_type, tokens.access_token)));
    assert(upstream_fails(stub->exchange_code("not-a-number", client)));

    // Registered codes are single use.
    StubSsoClient strict;
    strict.register_code("once", Verification{7, "Seven", "hash", "publicData", ""});
    auto t = coro::sync_wait(strict.exchange_code("once", client));
    assert(coro::sync_wait(strict.introspect("Bearer", t.access_token)).scopes == "publicData");
    assert(strict.last_client_id() == "cid");
    assert(upstream_fails(strict.exchange_code("once", client)));
    assert(upstream_fails(strict.exchange_code("12345", client)));

    // Unknown modes never yield a provider.
    bool refused = false;
    try {
        make_sso_client("HTTP", "https://unused", sched);
    } catch (const std::invalid_argument &) {
        refused = true;
    }
    assert(refused);

    // HTTP mode: transport failures surface as UpstreamError.
    auto http = make_sso_client("http", "http://127.0.0.1:1", sched);
    assert(upstream_fails(http->exchange_code("code", client)));
    assert(upstream_fails(http->introspect("Bearer", "token")));
    assert(upstream_fails(http->revoke("token", client)));

    std::cout << "unit_sso_client OK" << std::endl;
    return 0;
}
