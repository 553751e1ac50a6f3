// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/directory/memory_directory.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/sso/sso_client.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace eden {
std::atomic_bool g_shutdown{false};
} // namespace eden

static void handle_signal(int)
{
    eden::g_shutdown.store(true);
    eden::log::info("Signal received, shutting down...");
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // First non-flag = config path
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                eden::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                eden::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    eden::ServerConfig cfg;
    try {
        cfg = eden::load_config(config_path);
        eden::apply_env_overrides(cfg);
    } catch (const std::exception &ex) {
        eden::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    }
    if (cli_port_override)
        cfg.listen_port = port_override;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Apply logging config via environment before first log init; an explicit external setting wins.
    if (!cfg.log_level.empty() && std::getenv("EDEN_LOG_LEVEL") == nullptr)
        setenv("EDEN_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("EDEN_LOG_JSON", "1", 1);
    eden::log::init();
    eden::log::info("edenauth server starting (version: {})", EDEN_VERSION);
    eden::log::info("Listening on port: {}", cfg.listen_port);
    eden::log::info("SSO mode: {} ({})", cfg.sso_mode, cfg.sso_base_url);
    if (duration_override_sec > 0)
        eden::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    auto scheduler = coro::default_executor::io_executor();
    // Collaborators and flows live for the whole process (listener coroutines reference them).
    static std::unique_ptr<eden::sso::ISsoClient> sso_storage;
    static eden::directory::MemoryDirectory directory;
    static eden::directory::MemoryUserAccounts users;
    static std::unique_ptr<eden::auth::AuthFlows> flows;
    try {
        sso_storage = eden::sso::make_sso_client(cfg.sso_mode, cfg.sso_base_url, scheduler);
        flows = std::make_unique<eden::auth::AuthFlows>(
            eden::flow_settings(cfg),
            eden::crypto::StateCodec(cfg.jwt_secret),
            eden::crypto::SessionTokenIssuer(cfg.jwt_secret, cfg.jwt_issuer),
            *sso_storage,
            directory,
            users);
    } catch (const std::exception &ex) {
        eden::log::error("Failed to initialise auth flows: {}", ex.what());
        return 1;
    }
    static eden::net::Router router(*flows);

    scheduler->spawn(eden::net::run_listener(scheduler, cfg.listen_port, router));
    if (cfg.metrics_port != 0)
        scheduler->spawn(eden::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    while (!eden::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (duration_override_sec > 0) {
            auto elapsed =
                std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - run_start).count();
            if (elapsed >= duration_override_sec) {
                eden::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                eden::g_shutdown.store(true);
            }
        }
    }
    auto &f = eden::metrics::flows();
    eden::log::info(
        "{\"metric\":\"flow_totals\",\"sessions_delivered\":{},\"profiles_created\":{},\"characters_linked\":{},\"blocked\":{}}",
        f.sessions_delivered.load(),
        f.profiles_created.load(),
        f.characters_linked.load(),
        f.blocked_character_not_found.load() + f.blocked_missing_scopes.load());
    return 0;
}
