// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace eden {

namespace {
void load_client(const YAML::Node &node, sso::ClientProfile &client)
{
    if (!node)
        return;
    if (node["id"])
        client.id = node["id"].as<std::string>();
    if (node["secret"])
        client.secret = node["secret"].as<std::string>();
    if (node["redirect_uri"])
        client.redirect_uri = node["redirect_uri"].as<std::string>();
    if (node["authorize_path"])
        client.authorize_path = node["authorize_path"].as<std::string>();
}
} // namespace

ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["jwt_issuer"])
        cfg.jwt_issuer = root["jwt_issuer"].as<std::string>();
    if (root["jwt_secret"])
        cfg.jwt_secret = root["jwt_secret"].as<std::string>();
    if (root["accounts_origin"])
        cfg.accounts_origin = root["accounts_origin"].as<std::string>();
    if (root["cookie_domain"])
        cfg.cookie_domain = root["cookie_domain"].as<std::string>();
    if (root["sso_mode"])
        cfg.sso_mode = root["sso_mode"].as<std::string>();
    if (cfg.sso_mode != "http" && cfg.sso_mode != "stub")
        throw std::invalid_argument("unknown sso_mode '" + cfg.sso_mode + "' (expected http or stub)");
    if (root["sso_base_url"])
        cfg.sso_base_url = root["sso_base_url"].as<std::string>();
    load_client(root["login_client"], cfg.login_client);
    load_client(root["register_client"], cfg.register_client);
    return cfg;
}

void apply_env_overrides(ServerConfig &cfg)
{
    if (const char *secret = std::getenv("EDEN_JWT_SECRET"))
        cfg.jwt_secret = secret;
    if (cfg.jwt_secret.empty())
        throw std::invalid_argument("jwt_secret is empty (set it in the config or EDEN_JWT_SECRET)");
}

auth::FlowSettings flow_settings(const ServerConfig &cfg)
{
    auth::FlowSettings s;
    s.sso_base_url = cfg.sso_base_url;
    s.accounts_origin = cfg.accounts_origin;
    s.login_client = cfg.login_client;
    s.register_client = cfg.register_client;
    s.cookie.domain = cfg.cookie_domain;
    return s;
}

} // namespace eden
