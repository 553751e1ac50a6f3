// SPDX-License-Identifier: Apache-2.0
#include "server/auth/delivery.hpp"

namespace eden::auth {

namespace {
std::string attributes(const CookieSettings &cookie)
{
    std::string a;
    if (!cookie.domain.empty())
        a += "; Domain=" + cookie.domain;
    a += "; Path=" + cookie.path;
    a += "; Secure; HttpOnly; SameSite=Strict";
    return a;
}
} // namespace

std::string session_cookie(const std::string &artifact, bool persistent, const CookieSettings &cookie)
{
    std::string c = cookie.name + "=" + artifact;
    if (persistent)
        c += "; Max-Age=" + std::to_string(PERSISTENT_COOKIE_MAX_AGE);
    return c + attributes(cookie);
}

std::string clear_session_cookie(const CookieSettings &cookie)
{
    return cookie.name + "=; Max-Age=0; Expires=Thu, 01 Jan 1970 00:00:00 GMT" + attributes(cookie);
}

net::Response deliver(
    const std::string &target, const std::string &artifact, DeliveryMode mode, const CookieSettings &cookie)
{
    switch (mode) {
        case DeliveryMode::token:
            return net::Response::redirect(target + "#" + artifact);
        case DeliveryMode::persistent_cookie:
        case DeliveryMode::session_cookie: {
            auto r = net::Response::redirect(target);
            r.set_cookies.push_back(session_cookie(artifact, mode == DeliveryMode::persistent_cookie, cookie));
            return r;
        }
        case DeliveryMode::none:
            break;
    }
    return net::Response::redirect(target);
}

} // namespace eden::auth
