// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

int main()
{
    const char *path = "unit_config_test.yaml";
    {
        std::ofstream out(path);
        out << "listen_port: 18080\n"
               "metrics_port: 19100\n"
               "jwt_issuer: issuer.test\n"
               "jwt_secret: from-file\n"
               "cookie_domain: cookies.test\n"
               "sso_mode: http\n"
               "login_client:\n"
               "  id: lid\n"
               "  secret: lsecret\n"
               "  redirect_uri: https://api.test/auth/login/callback\n";
    }
    unsetenv("EDEN_JWT_SECRET");
    auto cfg = eden::load_config(path);
    assert(cfg.listen_port == 18080);
    assert(cfg.metrics_port == 19100);
    assert(cfg.jwt_issuer == "issuer.test");
    assert(cfg.sso_mode == "http");
    assert(cfg.login_client.id == "lid");
    assert(cfg.login_client.redirect_uri == "https://api.test/auth/login/callback");
    // Absent keys keep defaults.
    assert(cfg.register_client.id.empty());
    assert(cfg.login_client.authorize_path == "/oauth/authorize");
    assert(cfg.register_client.authorize_path == "/oauth/authorize/");
    assert(cfg.log_level == "info");
    assert(cfg.sso_base_url == "https://login.eveonline.com");

    eden::apply_env_overrides(cfg);
    assert(cfg.jwt_secret == "from-file");
    setenv("EDEN_JWT_SECRET", "from-env", 1);
    eden::apply_env_overrides(cfg);
    assert(cfg.jwt_secret == "from-env");

    setenv("EDEN_JWT_SECRET", "", 1);
    bool threw = false;
    try {
        eden::apply_env_overrides(cfg);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    unsetenv("EDEN_JWT_SECRET");

    auto settings = eden::flow_settings(cfg);
    assert(settings.cookie.domain == "cookies.test");
    assert(settings.cookie.name == "profile_jwt");
    assert(settings.login_client.secret == "lsecret");

    // Defaults: real provider, fixed issuer.
    eden::ServerConfig defaults;
    assert(defaults.sso_mode == "http");
    assert(defaults.jwt_issuer == "https://api.new-eden.io");

    // An unknown provider mode is refused rather than falling back to the stub.
    const char *bad_path = "unit_config_bad_mode.yaml";
    for (const char *mode : {"HTTP", "htpp", "\"\""}) {
        {
            std::ofstream out(bad_path);
            out << "jwt_secret: s\nsso_mode: " << mode << "\n";
        }
        bool rejected = false;
        try {
            eden::load_config(bad_path);
        } catch (const std::invalid_argument &) {
            rejected = true;
        }
        assert(rejected);
    }
    std::remove(bad_path);

    // Shipped development profile loads.
    auto dev = eden::load_config("config/server.yaml");
    assert(dev.sso_mode == "stub");
    assert(!dev.jwt_secret.empty());

    std::remove(path);
    std::cout << "unit_config OK" << std::endl;
    return 0;
}
