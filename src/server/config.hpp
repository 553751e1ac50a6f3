// SPDX-License-Identifier: Apache-2.0
// config.hpp
// Server configuration loaded from YAML (yaml-cpp). Missing keys keep their defaults.
#pragma once

#include "server/auth/flows.hpp"

#include <cstdint>
#include <string>

namespace eden {

struct ServerConfig
{
    uint16_t listen_port{8080};
    uint16_t metrics_port{0}; // 0 disables
    std::string log_level{"info"};
    bool log_json{false};
    std::string jwt_issuer{"https://api.new-eden.io"};
    std::string jwt_secret;
    std::string accounts_origin{"https://accounts.new-eden.io"};
    std::string cookie_domain{"new-eden.io"};
    std::string sso_mode{"http"}; // "stub" only when set explicitly
    std::string sso_base_url{"https://login.eveonline.com"};
    sso::ClientProfile login_client;
    sso::ClientProfile register_client{"", "", "", "/oauth/authorize/"};
};

// Throws YAML::Exception for unreadable files or mistyped values, std::invalid_argument
// for an unknown sso_mode.
ServerConfig load_config(const std::string &path);

// EDEN_JWT_SECRET replaces jwt_secret when set. Throws std::invalid_argument if the
// resulting secret is empty.
void apply_env_overrides(ServerConfig &cfg);

auth::FlowSettings flow_settings(const ServerConfig &cfg);

} // namespace eden
