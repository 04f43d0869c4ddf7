// SPDX-License-Identifier: Apache-2.0
// Structured logger (header-only) shared by the engine, sandbox and CLI.
// Lines are written synchronously under a mutex: a warning emitted during
// tick N is on stderr before tick N+1 starts. Provides:
//  - Level filtering via DUEL_LOG_LEVEL (trace|debug|info|warn|error)
//  - JSON mode via DUEL_LOG_JSON presence
//  - Optional app id prefix (DUEL_LOG_APP_ID)
//  - Optional external callback (set_callback), invoked after each emitted line

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace duel::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {
inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_env_loaded{false};
inline std::atomic<bool> g_app_id_enabled{false};
inline std::string g_app_id; // guarded by g_io_mtx
inline std::mutex g_io_mtx;
using cb_sig = void (*)(int, const char *, void *);
inline std::atomic<void *> g_cb_ptr{nullptr};
inline std::atomic<void *> g_cb_ud{nullptr};

inline cb_sig load_cb()
{
    return reinterpret_cast<cb_sig>(g_cb_ptr.load(std::memory_order_acquire));
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
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

inline char level_tag(level lv)
{
    switch (lv) {
        case level::trace:
            return 'T';
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
}

inline int parse_level(const std::string &s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return (int)level::trace;
    if (v == "debug")
        return (int)level::debug;
    if (v == "info")
        return (int)level::info;
    if (v == "warn" || v == "warning")
        return (int)level::warn;
    if (v == "error" || v == "err")
        return (int)level::error;
    return (int)level::info;
}

// Environment is read once, lazily, on the first filtered call.
inline void load_env()
{
    if (g_env_loaded.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("DUEL_LOG_LEVEL"))
        g_level.store(parse_level(lvl), std::memory_order_relaxed);
    if (std::getenv("DUEL_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("DUEL_LOG_APP_ID")) {
        if (*app) {
            std::lock_guard lk(g_io_mtx);
            g_app_id.assign(app);
            g_app_id_enabled.store(true, std::memory_order_relaxed);
        }
    }
}
} // namespace detail

// Formatting helpers are outside detail to be visible to variadic logging wrappers.
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
    else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss.setf(std::ios::fixed, std::ios::floatfield);
            oss.precision(3);
            oss << v;
            return oss.str();
        } else
            return std::to_string(v);
    } else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
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
        // surplus args are appended space-separated so nothing is silently dropped
        for (; idx < N; ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}
} // namespace detail_format

namespace detail {
inline void format_and_write(level lv, std::string_view m)
{
    auto tp = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    {
        std::lock_guard lk(g_io_mtx);
        if (g_json.load(std::memory_order_relaxed)) {
            std::cerr << '{' << "\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                      << level_name(lv) << "\",\"msg\":\"";
            for (char c : m) {
                if (c == '"' || c == '\\')
                    std::cerr << '\\' << c;
                else if (c == '\n')
                    std::cerr << "\\n";
                else
                    std::cerr << c;
            }
            std::cerr << "\"}" << std::endl;
        } else {
            char buf[16];
            std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
            if (g_app_id_enabled.load(std::memory_order_relaxed) && !g_app_id.empty())
                std::cerr << g_app_id << ' ';
            std::cerr << '[' << level_tag(lv) << ' ' << buf << "] " << m << std::endl;
        }
    }
    if (auto cb = load_cb()) {
        std::string copy(m);
        cb((int)lv, copy.c_str(), g_cb_ud.load(std::memory_order_relaxed));
    }
}
} // namespace detail

inline void init()
{
    detail::load_env();
}

inline void set_level(level lv) noexcept
{
    detail::load_env();
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(const std::string &name)
{
    set_level(static_cast<level>(detail::parse_level(name)));
}

inline void set_json(bool on) noexcept
{
    detail::g_json.store(on, std::memory_order_relaxed);
}

inline bool enabled(level lv) noexcept
{
    detail::load_env();
    return (int)lv >= detail::g_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    detail::g_cb_ud.store(ud, std::memory_order_release);
    detail::g_cb_ptr.store(reinterpret_cast<void *>(cb), std::memory_order_release);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::format_and_write(lv, msg);
}

// Variadic formatting convenience wrappers ({} placeholder based)
template <typename... Args>
inline void trace(const char *fmt, Args &&...args)
{
    if (enabled(level::trace))
        write(level::trace, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
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

} // namespace duel::log
