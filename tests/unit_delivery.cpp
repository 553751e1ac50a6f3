// SPDX-License-Identifier: Apache-2.0
#include "server/auth/delivery.hpp"

#include <cassert>
#include <iostream>

using namespace eden::auth;

int main()
{
    CookieSettings cookie;
    const std::string target = "https://app.new-eden.io/home";

    auto none = deliver(target, "jwt", DeliveryMode::none, cookie);
    assert(none.status == 302 && none.location == target && none.set_cookies.empty());

    auto token = deliver(target, "jwt", DeliveryMode::token, cookie);
    assert(token.status == 302 && token.location == target + "#jwt" && token.set_cookies.empty());

    auto persistent = deliver(target, "jwt", DeliveryMode::persistent_cookie, cookie);
    assert(persistent.location == target);
    assert(persistent.set_cookies.size() == 1);
    assert(
        persistent.set_cookies[0]
        == "profile_jwt=jwt; Max-Age=315360000; Domain=new-eden.io; Path=/; Secure; HttpOnly; SameSite=Strict");

    auto session = deliver(target, "jwt", DeliveryMode::session_cookie, cookie);
    assert(session.location == target);
    assert(session.set_cookies.size() == 1);
    assert(session.set_cookies[0] == "profile_jwt=jwt; Domain=new-eden.io; Path=/; Secure; HttpOnly; SameSite=Strict");

    auto cleared = clear_session_cookie(cookie);
    assert(cleared.rfind("profile_jwt=; Max-Age=0;", 0) == 0);
    assert(cleared.find("Domain=new-eden.io; Path=/") != std::string::npos);

    assert(parse_delivery_mode("none") == DeliveryMode::none);
    assert(parse_delivery_mode("token") == DeliveryMode::token);
    assert(parse_delivery_mode("persistent") == DeliveryMode::persistent_cookie);
    assert(parse_delivery_mode("session") == DeliveryMode::session_cookie);
    assert(!parse_delivery_mode("cookie"));
    assert(!parse_delivery_mode(""));

    std::cout << "unit_delivery OK" << std::endl;
    return 0;
}
