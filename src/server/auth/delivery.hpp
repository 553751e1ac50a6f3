// SPDX-License-Identifier: Apache-2.0
// delivery.hpp
// Hands a finished session artifact to the browser according to the requested response_type.
#pragma once

#include "server/auth/flow_state.hpp"
#include "server/net/http.hpp"

#include <cstdint>
#include <string>

namespace eden::auth {

struct CookieSettings
{
    std::string name{"profile_jwt"};
    std::string domain{"new-eden.io"};
    std::string path{"/"};
};

// Ten years, in seconds.
inline constexpr int64_t PERSISTENT_COOKIE_MAX_AGE = 60LL * 60 * 24 * 365 * 10;

// none: 302 target; token: 302 target#artifact; persistent/session: cookie + 302 target.
net::Response deliver(
    const std::string &target, const std::string &artifact, DeliveryMode mode, const CookieSettings &cookie);

std::string session_cookie(const std::string &artifact, bool persistent, const CookieSettings &cookie);
// Expires the session cookie (same name, domain, path).
std::string clear_session_cookie(const CookieSettings &cookie);

} // namespace eden::auth
