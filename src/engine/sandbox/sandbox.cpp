// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/sandbox.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "engine/sandbox/errors.hpp"
#include "engine/sandbox/interpreter.hpp"
#include "engine/sandbox/parser.hpp"

namespace duel::sandbox {

std::optional<std::string> check_behavior_syntax(std::string_view source)
{
    try {
        parse_program(source);
    } catch (const CompileError &e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

CompiledBehavior compile_behavior(std::string_view source)
{
    CompiledBehavior out;
    try {
        out.program = parse_program(source);
    } catch (const CompileError &e) {
        out.program = std::make_shared<const ast::Program>();
        out.error = std::string("Compilation error: ") + e.what();
        metrics::runtime().behavior_compile_errors.fetch_add(1, std::memory_order_relaxed);
        log::warn("[sandbox] {}", out.error);
    }
    return out;
}

bool execute_behavior(
    const CompiledBehavior &behavior,
    BehaviorApi &api,
    uint64_t tick,
    uint64_t step_budget,
    std::string_view label)
{
    if (!behavior.program)
        return false;
    auto &counters = metrics::runtime();
    counters.behavior_invocations.fetch_add(1, std::memory_order_relaxed);
    Interpreter interp(step_budget);
    try {
        interp.define_global("api", api.script_object());
        interp.define_global("tick", Value(tick));
        interp.define_global("Math", api.math_object());
        interp.run(*behavior.program);
        log::trace("[sandbox] {} tick={} steps={}", label, tick, interp.steps_used());
        return true;
    } catch (const BudgetExceeded &e) {
        counters.behavior_budget_exhausted.fetch_add(1, std::memory_order_relaxed);
        counters.behavior_runtime_errors.fetch_add(1, std::memory_order_relaxed);
        DUEL_LOG_EVERY_N(warn, 30, "[sandbox] {} tick={} aborted: {}", label, tick, e.what());
    } catch (const BehaviorError &e) {
        counters.behavior_runtime_errors.fetch_add(1, std::memory_order_relaxed);
        DUEL_LOG_EVERY_N(warn, 30, "[sandbox] {} tick={} runtime error: {}", label, tick, e.what());
    } catch (const std::exception &e) {
        counters.behavior_runtime_errors.fetch_add(1, std::memory_order_relaxed);
        log::error("[sandbox] {} tick={} host failure: {}", label, tick, e.what());
    }
    return false;
}

} // namespace duel::sandbox
