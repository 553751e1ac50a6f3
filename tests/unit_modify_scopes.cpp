// SPDX-License-Identifier: Apache-2.0
#include "test_fixtures.hpp"

#include "common/url.hpp"

#include <iostream>

using namespace eden;
using namespace eden::testing;

static const std::string TITLES = "esi-characters.read_titles.v1";
static const std::string ROLES = "esi-characters.read_corporation_roles.v1";
static const std::string SKILLS = "esi-skills.read_skills.v1";
static const std::string WALLET = "esi-wallet.read_character_wallet.v1";
static const std::string TARGET = "https://app.new-eden.io/skills";

int main()
{
    FlowHarness h;
    auto account = h.seed_character(6001, "Trader", TITLES + " " + WALLET);
    auto state = h.flows->codec().encode(auth::ScopeUpgradeFlow{account, 6001, {SKILLS}});

    // Requested deficit first, then everything already held.
    auto r = coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}, {"state", state}})));
    assert(r.status == 302);
    assert(
        r.location
        == "/auth/register?redirect_to=" + url::encode_component(TARGET) + "&response_type=none&scopes=" + SKILLS + "%20"
            + TITLES + "%20" + WALLET);

    // The hop lands on the register entry, which accepts the merged list.
    auto hop = h.flows->start_register(get("/auth/register", {{"redirect_to", TARGET}, {"response_type", "none"}, {"scopes", query_value(r.location, "scopes")}}));
    assert(query_value(hop.location, "scope") == SKILLS + " " + TITLES + " " + WALLET + " " + ROLES);

    // Character without a grant falls back to the defaults.
    directory::CharacterRecord bare{6002, account, "Bare", "hash", std::nullopt};
    coro::sync_wait(h.directory.put_character(bare));
    auto bare_state = h.flows->codec().encode(auth::ScopeUpgradeFlow{account, 6002, {SKILLS}});
    auto rb = coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}, {"state", bare_state}})));
    assert(query_value(rb.location, "scopes") == SKILLS + " " + TITLES + " " + ROLES);

    // Rejections: missing params, foreign variant, garbage, unknown character.
    assert(http_status_of([&] { coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"state", state}}))); }) == 400);
    assert(http_status_of([&] { coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}}))); }) == 400);
    auto login_state = h.flows->codec().encode(auth::LoginFlow{HOST, auth::DeliveryMode::token, {SKILLS}, TARGET});
    assert(http_status_of([&] {
               coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}, {"state", login_state}})));
           }) == 400);
    assert(http_status_of([&] {
               coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}, {"state", "garbage"}})));
           }) == 400);
    auto ghost = h.flows->codec().encode(auth::ScopeUpgradeFlow{account, 9999, {SKILLS}});
    assert(http_status_of([&] {
               coro::sync_wait(h.flows->modify_scopes(get("/auth/scopes", {{"redirect_to", TARGET}, {"state", ghost}})));
           }) == 400);

    std::cout << "unit_modify_scopes OK" << std::endl;
    return 0;
}
