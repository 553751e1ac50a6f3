// SPDX-License-Identifier: Apache-2.0
// Shared wiring for flow tests: stub provider, in-memory directory and request builders.
#pragma once

#include "common/http_error.hpp"
#include "server/auth/flows.hpp"
#include "server/directory/memory_directory.hpp"
#include "server/net/http.hpp"
#include "server/sso/stub_sso_client.hpp"

#include <coro/coro.hpp>

#include <cassert>
#include <memory>
#include <string>

namespace eden::testing {

inline constexpr const char *SECRET = "unit-test-secret";
inline constexpr const char *HOST = "app.new-eden.io";
inline constexpr const char *ISSUER = "https://api.new-eden.io";

struct FlowHarness
{
    sso::StubSsoClient sso{false};
    directory::MemoryDirectory directory;
    directory::MemoryUserAccounts users;
    std::unique_ptr<auth::AuthFlows> flows;

    FlowHarness()
    {
        auth::FlowSettings s;
        s.sso_base_url = "https://sso.test";
        s.accounts_origin = "https://accounts.test";
        s.login_client = {"login-id", "login-secret", "https://api.test/auth/login/callback"};
        s.register_client = {
            "register-id", "register-secret", "https://api.test/auth/register/callback", "/oauth/authorize/"};
        flows = std::make_unique<auth::AuthFlows>(
            s, crypto::StateCodec(SECRET), crypto::SessionTokenIssuer(SECRET, ISSUER), sso, directory, users);
    }

    // Character with a stored grant holding `scope`, linked to a fresh profile.
    std::string seed_character(int64_t id, const std::string &name, const std::string &scope)
    {
        std::string account = directory.generate_key();
        directory::CharacterRecord c;
        c.id = id;
        c.account_id = account;
        c.name = name;
        c.owner_hash = "hash-" + std::to_string(id);
        c.sso = directory::SsoGrant{"old-at-" + std::to_string(id), "old-rt", 1, scope};
        coro::sync_wait(directory.put_character(c));
        coro::sync_wait(directory.put_profile(directory::ProfileRecord{account, id, name, false}));
        return account;
    }

    void register_identity(const std::string &code, int64_t id, const std::string &name, const std::string &scopes)
    {
        sso::Verification who;
        who.character_id = id;
        who.character_name = name;
        who.owner_hash = "hash-" + std::to_string(id);
        who.scopes = scopes;
        sso.register_code(code, who);
    }
};

inline net::Request get(std::string path, std::unordered_map<std::string, std::string> query = {})
{
    net::Request r;
    r.method = "GET";
    r.path = std::move(path);
    r.query = std::move(query);
    r.headers["host"] = HOST;
    return r;
}

// Value of `name` in the query string of `url`, percent-decoded.
inline std::string query_value(const std::string &url, const std::string &name)
{
    auto q = url.find('?');
    assert(q != std::string::npos);
    auto params = net::parse_query(std::string_view(url).substr(q + 1));
    auto it = params.find(name);
    return it == params.end() ? std::string() : it->second;
}

// Status of the HttpError thrown by `fn`, 0 if it returned normally.
template <typename Fn>
int http_status_of(Fn &&fn)
{
    try {
        fn();
    } catch (const HttpError &ex) {
        return ex.status();
    }
    return 0;
}

inline bool starts_with(const std::string &s, const std::string &prefix)
{
    return s.rfind(prefix, 0) == 0;
}

} // namespace eden::testing
