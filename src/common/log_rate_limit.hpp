// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging.
// Emits on the 1st invocation and then every Nth one after it, so the first occurrence of a
// recurring problem is always visible. The counter is shared by every match in the process.
// Usage: DUEL_LOG_EVERY_N(warn, 30, "[sandbox] runtime error bot={} msg={}", id, what);
#define DUEL_LOG_EVERY_N(lvl, N, ...) \
    do { \
        static std::atomic<uint64_t> duel_log_every_n_counter{0}; \
        if ((duel_log_every_n_counter.fetch_add(1, std::memory_order_relaxed) % (N)) == 0) { \
            duel::log::lvl(__VA_ARGS__); \
        } \
    } while (0)
