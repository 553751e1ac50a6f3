// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide auth flow counters (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>

namespace eden::metrics {

struct FlowCounters
{
    // Entry endpoints that produced a provider redirect.
    std::atomic<uint64_t> login_started{0};
    std::atomic<uint64_t> register_started{0};
    std::atomic<uint64_t> add_character_started{0};
    std::atomic<uint64_t> modify_scopes_started{0};
    // Callback outcomes.
    std::atomic<uint64_t> sessions_delivered{0};
    std::atomic<uint64_t> profiles_created{0};
    std::atomic<uint64_t> characters_linked{0};
    std::atomic<uint64_t> grants_replaced{0};
    std::atomic<uint64_t> blocked_character_not_found{0};
    std::atomic<uint64_t> blocked_missing_scopes{0};
    std::atomic<uint64_t> verify_ok{0};
};

struct HttpCounters
{
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> bad_requests{0};
    std::atomic<uint64_t> unauthorized{0};
    std::atomic<uint64_t> not_found{0};
    std::atomic<uint64_t> internal_errors{0};
    std::atomic<uint64_t> upstream_failures{0};
};

inline FlowCounters &flows()
{
    static FlowCounters c;
    return c;
}

inline HttpCounters &http()
{
    static HttpCounters c;
    return c;
}

inline void bump(std::atomic<uint64_t> &counter) noexcept
{
    counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace eden::metrics
