// SPDX-License-Identifier: Apache-2.0
#include "server/auth/scopes.hpp"

#include "common/http_error.hpp"
#include "common/url.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace eden::auth {

namespace {
// Scopes published by EVE SSO for third-party applications.
constexpr std::array<std::string_view, 69> CATALOG = {
    "publicData",
    "esi-alliances.read_contacts.v1",
    "esi-assets.read_assets.v1",
    "esi-assets.read_corporation_assets.v1",
    "esi-bookmarks.read_character_bookmarks.v1",
    "esi-bookmarks.read_corporation_bookmarks.v1",
    "esi-calendar.read_calendar_events.v1",
    "esi-calendar.respond_calendar_events.v1",
    "esi-characters.read_agents_research.v1",
    "esi-characters.read_blueprints.v1",
    "esi-characters.read_contacts.v1",
    "esi-characters.read_corporation_roles.v1",
    "esi-characters.read_fatigue.v1",
    "esi-characters.read_fw_stats.v1",
    "esi-characters.read_loyalty.v1",
    "esi-characters.read_medals.v1",
    "esi-characters.read_notifications.v1",
    "esi-characters.read_opportunities.v1",
    "esi-characters.read_standings.v1",
    "esi-characters.read_titles.v1",
    "esi-characters.write_contacts.v1",
    "esi-characterstats.read.v1",
    "esi-clones.read_clones.v1",
    "esi-clones.read_implants.v1",
    "esi-contracts.read_character_contracts.v1",
    "esi-contracts.read_corporation_contracts.v1",
    "esi-corporations.read_blueprints.v1",
    "esi-corporations.read_contacts.v1",
    "esi-corporations.read_container_logs.v1",
    "esi-corporations.read_corporation_membership.v1",
    "esi-corporations.read_divisions.v1",
    "esi-corporations.read_facilities.v1",
    "esi-corporations.read_fw_stats.v1",
    "esi-corporations.read_medals.v1",
    "esi-corporations.read_outposts.v1",
    "esi-corporations.read_standings.v1",
    "esi-corporations.read_starbases.v1",
    "esi-corporations.read_structures.v1",
    "esi-corporations.read_titles.v1",
    "esi-corporations.track_members.v1",
    "esi-fittings.read_fittings.v1",
    "esi-fittings.write_fittings.v1",
    "esi-fleets.read_fleet.v1",
    "esi-fleets.write_fleet.v1",
    "esi-industry.read_character_jobs.v1",
    "esi-industry.read_character_mining.v1",
    "esi-industry.read_corporation_jobs.v1",
    "esi-industry.read_corporation_mining.v1",
    "esi-killmails.read_corporation_killmails.v1",
    "esi-killmails.read_killmails.v1",
    "esi-location.read_location.v1",
    "esi-location.read_online.v1",
    "esi-location.read_ship_type.v1",
    "esi-mail.organize_mail.v1",
    "esi-mail.read_mail.v1",
    "esi-mail.send_mail.v1",
    "esi-markets.read_character_orders.v1",
    "esi-markets.read_corporation_orders.v1",
    "esi-markets.structure_markets.v1",
    "esi-planets.manage_planets.v1",
    "esi-planets.read_customs_offices.v1",
    "esi-search.search_structures.v1",
    "esi-skills.read_skillqueue.v1",
    "esi-skills.read_skills.v1",
    "esi-ui.open_window.v1",
    "esi-ui.write_waypoint.v1",
    "esi-universe.read_structures.v1",
    "esi-wallet.read_character_wallet.v1",
    "esi-wallet.read_corporation_wallets.v1",
};

bool contains(const ScopeList &list, std::string_view scope)
{
    return std::find(list.begin(), list.end(), scope) != list.end();
}

void append_missing(ScopeList &into, const ScopeList &from)
{
    for (const auto &s : from) {
        if (!contains(into, s))
            into.push_back(s);
    }
}
} // namespace

const ScopeList &default_scopes()
{
    static const ScopeList defaults{
        "esi-characters.read_titles.v1",
        "esi-characters.read_corporation_roles.v1",
    };
    return defaults;
}

bool is_known_scope(std::string_view scope)
{
    return std::find(CATALOG.begin(), CATALOG.end(), scope) != CATALOG.end();
}

ScopeList split_scopes(std::string_view text)
{
    ScopeList out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i])))
            ++i;
        if (i > start) {
            std::string item(text.substr(start, i - start));
            if (!contains(out, item))
                out.push_back(std::move(item));
        }
    }
    return out;
}

std::string join_scopes(const ScopeList &scopes)
{
    std::string out;
    for (const auto &s : scopes) {
        if (!out.empty())
            out += "%20";
        out += s;
    }
    return out;
}

ScopeList normalize_requested(const std::optional<std::string> &raw)
{
    if (!raw || raw->empty())
        throw bad_request("Invalid Request, scopes parameter is required.");
    ScopeList scopes = split_scopes(url::decode(*raw));
    append_missing(scopes, default_scopes());
    for (const auto &s : scopes) {
        if (!is_known_scope(s))
            throw bad_request("Invalid scopes parameter");
    }
    return scopes;
}

ScopeList build_register_scopes(const std::optional<std::string> &raw)
{
    if (raw && !raw->empty())
        return normalize_requested(raw);
    return default_scopes();
}

std::optional<ScopeList> compute_deficit(const ScopeList &required, const std::optional<directory::SsoGrant> &held)
{
    if (!held)
        return required;
    ScopeList current = split_scopes(held->scope);
    ScopeList missing;
    for (const auto &s : required) {
        if (!contains(current, s))
            missing.push_back(s);
    }
    if (missing.empty())
        return std::nullopt;
    return missing;
}

ScopeList merge_held_scopes(ScopeList requested, const std::optional<directory::SsoGrant> &held)
{
    append_missing(requested, held ? split_scopes(held->scope) : default_scopes());
    return requested;
}

} // namespace eden::auth
