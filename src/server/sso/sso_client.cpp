// SPDX-License-Identifier: Apache-2.0
#include "server/sso/sso_client.hpp"

#include "common/logger.hpp"
#include "server/sso/http_sso_client.hpp"
#include "server/sso/stub_sso_client.hpp"

#include <stdexcept>

namespace eden::sso {

std::unique_ptr<ISsoClient> make_sso_client(
    const std::string &mode, const std::string &base_url, std::shared_ptr<coro::io_scheduler> scheduler)
{
    if (mode == "http")
        return std::make_unique<HttpSsoClient>(base_url, std::move(scheduler));
    if (mode == "stub") {
        eden::log::warn("[sso] stub provider enabled; identities are not verified");
        return std::make_unique<StubSsoClient>(true);
    }
    throw std::invalid_argument("unknown sso_mode '" + mode + "' (expected http or stub)");
}

} // namespace eden::sso
