// SPDX-License-Identifier: Apache-2.0
#include "server/auth/flow_state.hpp"

namespace eden::auth {

std::optional<DeliveryMode> parse_delivery_mode(std::string_view value)
{
    if (value == "none")
        return DeliveryMode::none;
    if (value == "token")
        return DeliveryMode::token;
    if (value == "persistent")
        return DeliveryMode::persistent_cookie;
    if (value == "session")
        return DeliveryMode::session_cookie;
    return std::nullopt;
}

const char *delivery_mode_name(DeliveryMode mode)
{
    switch (mode) {
        case DeliveryMode::none:
            return "none";
        case DeliveryMode::token:
            return "token";
        case DeliveryMode::persistent_cookie:
            return "persistent";
        case DeliveryMode::session_cookie:
            return "session";
    }
    return "none";
}

const char *flow_variant_name(const FlowState &state)
{
    switch (state.index()) {
        case 0:
            return "login";
        case 1:
            return "register";
        case 2:
            return "addCharacter";
        case 3:
            return "scopes";
    }
    return "unknown";
}

} // namespace eden::auth
