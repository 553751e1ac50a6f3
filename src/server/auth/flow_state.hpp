// SPDX-License-Identifier: Apache-2.0
// flow_state.hpp
// Transient state carried between the entry leg and the provider callback leg.
// Each alternative holds exactly the fields its flow needs; the active alternative is the
// flow variant tag.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace eden::auth {

// Ordered, duplicate-free list of scope names.
using ScopeList = std::vector<std::string>;

// How a finished session artifact reaches the client (response_type).
enum class DeliveryMode
{
    none,
    token,
    persistent_cookie,
    session_cookie
};

// "none" | "token" | "persistent" | "session"; nullopt for anything else.
std::optional<DeliveryMode> parse_delivery_mode(std::string_view value);
const char *delivery_mode_name(DeliveryMode mode);

struct LoginFlow
{
    std::string audience;
    DeliveryMode delivery{DeliveryMode::none};
    ScopeList scopes;
    std::string redirect;

    bool operator==(const LoginFlow &) const = default;
};

struct RegisterFlow
{
    std::string audience;
    DeliveryMode delivery{DeliveryMode::none};
    std::string redirect;

    bool operator==(const RegisterFlow &) const = default;
};

struct AddCharacterFlow
{
    std::string audience;
    std::string account_id; // profile the new character is linked to
    std::string redirect;

    bool operator==(const AddCharacterFlow &) const = default;
};

// Re-authorization request produced when a held grant lacks scopes; consumed by modify-scopes.
struct ScopeUpgradeFlow
{
    std::string account_id;
    int64_t character_id{0};
    ScopeList scopes; // the deficit

    bool operator==(const ScopeUpgradeFlow &) const = default;
};

using FlowState = std::variant<LoginFlow, RegisterFlow, AddCharacterFlow, ScopeUpgradeFlow>;

const char *flow_variant_name(const FlowState &state);

} // namespace eden::auth
