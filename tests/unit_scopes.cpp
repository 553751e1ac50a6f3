// SPDX-License-Identifier: Apache-2.0
#include "common/http_error.hpp"
#include "server/auth/scopes.hpp"

#include <cassert>
#include <iostream>

using namespace eden;
using namespace eden::auth;

static const std::string TITLES = "esi-characters.read_titles.v1";
static const std::string ROLES = "esi-characters.read_corporation_roles.v1";
static const std::string SKILLS = "esi-skills.read_skills.v1";
static const std::string WALLET = "esi-wallet.read_character_wallet.v1";

static bool rejects(const std::optional<std::string> &raw)
{
    try {
        normalize_requested(raw);
    } catch (const HttpError &ex) {
        assert(ex.status() == 400);
        return true;
    }
    return false;
}

int main()
{
    assert(default_scopes() == (ScopeList{TITLES, ROLES}));
    assert(is_known_scope(SKILLS));
    assert(is_known_scope("publicData"));
    assert(!is_known_scope("esi-made-up.v1"));

    // Defaults appended once, request order kept, duplicates dropped.
    auto n = normalize_requested(SKILLS + " " + TITLES + " " + SKILLS);
    assert(n == (ScopeList{SKILLS, TITLES, ROLES}));
    // Percent-encoded separators are decoded before splitting.
    assert(normalize_requested(SKILLS + "%20" + WALLET) == (ScopeList{SKILLS, WALLET, TITLES, ROLES}));

    assert(rejects(std::nullopt));
    assert(rejects(std::string()));
    assert(rejects(SKILLS + " esi-bogus.v1"));

    // Register scopes default when absent, validated when present.
    assert(build_register_scopes(std::nullopt) == default_scopes());
    assert(build_register_scopes(std::string()) == default_scopes());
    assert(build_register_scopes(WALLET) == (ScopeList{WALLET, TITLES, ROLES}));

    assert(join_scopes({SKILLS, WALLET}) == SKILLS + "%20" + WALLET);
    assert(split_scopes("  a\tb  a ") == (ScopeList{"a", "b"}));

    // Deficit: no grant means everything is missing; nullopt when nothing is.
    ScopeList required{TITLES, SKILLS};
    assert(compute_deficit(required, std::nullopt) == required);
    directory::SsoGrant g{"at", "rt", 0, TITLES + " " + ROLES};
    auto missing = compute_deficit(required, g);
    assert(missing && *missing == ScopeList{SKILLS});
    g.scope = TITLES + " " + SKILLS;
    assert(!compute_deficit(required, g));

    // Merge keeps requested order and appends what is already held.
    assert(merge_held_scopes({WALLET}, g) == (ScopeList{WALLET, TITLES, SKILLS}));
    assert(merge_held_scopes({WALLET}, std::nullopt) == (ScopeList{WALLET, TITLES, ROLES}));

    std::cout << "unit_scopes OK" << std::endl;
    return 0;
}
