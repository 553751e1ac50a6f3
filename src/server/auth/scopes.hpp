// SPDX-License-Identifier: Apache-2.0
// scopes.hpp
// ESI scope catalog, request normalization and grant deficit computation.
#pragma once

#include "server/auth/flow_state.hpp"
#include "server/directory/records.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace eden::auth {

// Always requested on top of whatever the client asks for.
const ScopeList &default_scopes();

bool is_known_scope(std::string_view scope);

// Splits on whitespace, dropping empty items and duplicates (first occurrence wins).
ScopeList split_scopes(std::string_view text);

// "a%20b%20c"; scope names never need escaping themselves.
std::string join_scopes(const ScopeList &scopes);

// Throws bad_request when raw is absent/empty or names a scope outside the catalog.
// Result: parsed scopes followed by any missing defaults.
ScopeList normalize_requested(const std::optional<std::string> &raw);

// Scopes for the register client: the normalized explicit request when present, else defaults.
ScopeList build_register_scopes(const std::optional<std::string> &raw);

// Without a grant the whole of `required` is missing. With one, returns the scopes it lacks,
// or nullopt when it covers everything.
std::optional<ScopeList> compute_deficit(const ScopeList &required, const std::optional<directory::SsoGrant> &held);

// requested + the grant's scopes (or the defaults when nothing is held).
ScopeList merge_held_scopes(ScopeList requested, const std::optional<directory::SsoGrant> &held);

} // namespace eden::auth
