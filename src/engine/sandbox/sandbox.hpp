// SPDX-License-Identifier: Apache-2.0
// sandbox.hpp - Compile and run untrusted per-tick behavior code
#pragma once
#include "engine/sandbox/ast.hpp"
#include "engine/sandbox/behavior_api.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace duel::sandbox {

inline constexpr uint64_t kDefaultStepBudget = 20000;

struct CompiledBehavior
{
    std::shared_ptr<const ast::Program> program; // never null; empty program on compile failure
    std::string error; // "Compilation error: ..." or empty

    bool ok() const
    {
        return error.empty();
    }
};

// Parse-only validation. Returns the error message, or nullopt when the source is well formed.
std::optional<std::string> check_behavior_syntax(std::string_view source);

// Never throws. On failure returns a no-op behavior together with the error text.
CompiledBehavior compile_behavior(std::string_view source);

// Runs the behavior with globals `api`, `tick` and `Math`. Any failure inside the script
// (compile-time or run-time, including budget exhaustion) is logged and reported as false;
// the caller must then ignore whatever intents `api` recorded.
bool execute_behavior(
    const CompiledBehavior &behavior,
    BehaviorApi &api,
    uint64_t tick,
    uint64_t step_budget = kDefaultStepBudget,
    std::string_view label = "bot");

} // namespace duel::sandbox
