// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (HTTP/1.1) exposing the auth flow counters.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace eden::net {

// Current counter values in Prometheus text format.
std::string render_metrics();

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

} // namespace eden::net
