// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation). Read by the CLI summary and by tests.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace duel::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick duration (base 50us) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{}; // bucket 0:<50us,1:<100us,...
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // Sandbox
    std::atomic<uint64_t> behavior_compile_errors{0};
    std::atomic<uint64_t> behavior_runtime_errors{0};
    std::atomic<uint64_t> behavior_budget_exhausted{0};
    std::atomic<uint64_t> behavior_invocations{0};
    // Combat
    std::atomic<uint64_t> attacks_total{0};
    std::atomic<uint64_t> hits_total{0};
    std::atomic<uint64_t> collisions_total{0};
    // Lifecycle gauges
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> matches_finished{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

// --- Tick duration histogram ---
inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 50000; // 50us
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        uint64_t bound = base << i;
        if (ns < bound) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the bucket holding the 99th percentile sample.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 50000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return (base << i);
    }
    return (base << (RuntimeCounters::TICK_BUCKETS - 1));
}

// Time the tick loop spent parked in the scheduler between ticks.
inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline std::string summary_json()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    uint64_t wait_samples = rt.wait_samples.load(std::memory_order_relaxed);
    uint64_t wait_mean_ns = wait_samples ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / wait_samples : 0;
    std::ostringstream j;
    j << "{\"metric\":\"runtime\"";
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << approx_tick_p99();
    j << ",\"wait_mean_ns\":" << wait_mean_ns;
    j << ",\"samples\":" << samples;
    j << ",\"behavior_invocations\":" << rt.behavior_invocations.load(std::memory_order_relaxed);
    j << ",\"behavior_compile_errors\":" << rt.behavior_compile_errors.load(std::memory_order_relaxed);
    j << ",\"behavior_runtime_errors\":" << rt.behavior_runtime_errors.load(std::memory_order_relaxed);
    j << ",\"behavior_budget_exhausted\":" << rt.behavior_budget_exhausted.load(std::memory_order_relaxed);
    j << ",\"attacks_total\":" << rt.attacks_total.load(std::memory_order_relaxed);
    j << ",\"hits_total\":" << rt.hits_total.load(std::memory_order_relaxed);
    j << ",\"collisions_total\":" << rt.collisions_total.load(std::memory_order_relaxed);
    j << ",\"matches_finished\":" << rt.matches_finished.load(std::memory_order_relaxed);
    j << "}";
    return j.str();
}

} // namespace duel::metrics
