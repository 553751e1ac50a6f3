// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A background thread drains a queue of formatted lines to stderr. Provides:
//  - Level filtering via EDEN_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via EDEN_LOG_JSON presence
//  - Optional process tag via EDEN_LOG_APP_ID
//  - redact() for credentials that must never reach the log verbatim

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace eden::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {
struct item
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::string g_app_id; // guarded by g_io_mtx
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<item> g_queue;
inline std::mutex g_io_mtx;
inline std::thread g_thread;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline int parse_level(const std::string &s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug")
        return (int)level::debug;
    if (v == "warn" || v == "warning")
        return (int)level::warn;
    if (v == "error" || v == "err")
        return (int)level::error;
    return (int)level::info;
}

inline void write_json_escaped(std::ostream &os, std::string_view m)
{
    for (char c : m) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            default:
                os << c;
        }
    }
}

inline void format_and_write(const item &it)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(it.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::lock_guard lk(g_io_mtx);
    if (g_json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                  << level_name(it.lv) << '"';
        if (!g_app_id.empty())
            std::cerr << ",\"app\":\"" << g_app_id << '"';
        std::cerr << ",\"msg\":\"";
        write_json_escaped(std::cerr, it.msg);
        std::cerr << "\"}" << std::endl;
        return;
    }
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    const char *tag = it.lv == level::debug ? "D" : it.lv == level::info ? "I" : it.lv == level::warn ? "W" : "E";
    if (!g_app_id.empty())
        std::cerr << g_app_id << ' ';
    std::cerr << '[' << tag << ' ' << buf << "] " << it.msg << std::endl;
}

inline void consumer_thread()
{
    for (;;) {
        std::deque<item> local;
        {
            std::unique_lock lk(g_q_mtx);
            g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_queue.empty(); });
            local.swap(g_queue);
        }
        for (auto &it : local)
            format_and_write(it);
        if (!g_running.load(std::memory_order_acquire)) {
            std::lock_guard lk(g_q_mtx);
            if (g_queue.empty())
                break;
        }
    }
}

inline void shutdown()
{
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_q_cv.notify_all();
    if (g_thread.joinable())
        g_thread.join();
}

inline void start()
{
    if (g_started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("EDEN_LOG_LEVEL"))
        g_level.store(parse_level(lvl), std::memory_order_relaxed);
    if (std::getenv("EDEN_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("EDEN_LOG_APP_ID")) {
        std::lock_guard lk(g_io_mtx);
        g_app_id.assign(app);
    }
    g_running.store(true, std::memory_order_release);
    g_thread = std::thread([] { consumer_thread(); });
    std::atexit([] { shutdown(); });
}
} // namespace detail

namespace detail_format {
template <typename T>
inline std::string to_string_any(const T &v)
{
    if constexpr (std::is_same_v<std::decay_t<T>, std::string>)
        return v;
    else if constexpr (std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0)
        return std::string(fmt);
    constexpr size_t N = sizeof...(Args);
    std::array<std::string, N> values{to_string_any(std::forward<Args>(args))...};
    std::string out;
    out.reserve(fmt.size() + N * 8);
    size_t search_pos = 0;
    size_t idx = 0;
    while (idx < N) {
        size_t p = fmt.find("{}", search_pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt.substr(search_pos, p - search_pos));
        out += values[idx++];
        search_pos = p + 2;
    }
    out.append(fmt.substr(search_pos));
    for (; idx < N; ++idx) {
        out.push_back(' ');
        out += values[idx];
    }
    return out;
}
} // namespace detail_format

inline void init()
{
    detail::start();
}

inline bool enabled(level lv) noexcept
{
    return (int)lv >= detail::g_level.load(std::memory_order_relaxed);
}

// Keeps a short prefix of a credential so log lines can be correlated without leaking it.
inline std::string redact(std::string_view secret)
{
    if (secret.size() <= 6)
        return "***";
    return std::string(secret.substr(0, 6)) + "...(" + std::to_string(secret.size()) + ")";
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    {
        std::lock_guard lk(detail::g_q_mtx);
        detail::g_queue.push_back(detail::item{lv, std::string(msg), std::chrono::system_clock::now()});
    }
    detail::g_q_cv.notify_one();
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

} // namespace eden::log
