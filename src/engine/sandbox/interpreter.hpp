// SPDX-License-Identifier: Apache-2.0
// interpreter.hpp - Tree-walking evaluator with a deterministic step budget
#pragma once
#include "engine/sandbox/ast.hpp"
#include "engine/sandbox/value.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace duel::sandbox {

// Bytes of strings and container slots one invocation may allocate in total.
inline constexpr uint64_t kDefaultMemoryBudget = 8 * 1024 * 1024;

// One interpreter per behavior invocation. Host globals are read-only; script variables
// live in a single function-level scope (var, let and const alike). Every statement and
// every expression node evaluated costs one step; exceeding the budget throws BudgetExceeded.
// Allocations are charged against a separate memory budget, and a store that would make a
// container reachable from itself is rejected, so all script values are freed with the
// interpreter.
class Interpreter
{
public:
    explicit Interpreter(uint64_t step_budget, uint64_t memory_budget = kDefaultMemoryBudget);

    void define_global(const std::string &name, Value v);

    // Runs to completion or to the first `return`. Throws RuntimeError / BudgetExceeded.
    Value run(const ast::Program &program);

    uint64_t steps_used() const
    {
        return m_steps;
    }
    uint64_t bytes_allocated() const
    {
        return m_bytes;
    }

private:
    enum class Flow
    {
        normal,
        break_loop,
        continue_loop,
        return_value
    };

    Flow exec(const ast::Stmt &s);
    Flow exec_loop_body(const ast::Stmt &body, bool &stop);
    Value eval(const ast::Expr &e);

    Value eval_binary(ast::Op op, const Value &lhs, const Value &rhs, const ast::Expr &at);
    Value eval_call(const ast::Expr &e);
    Value eval_assign(const ast::Expr &e);
    Value eval_update(const ast::Expr &e);

    Value load_variable(const ast::Expr &ident);
    void store_variable(const ast::Expr &ident, Value v);
    Value get_property(const Value &target, const Value &key, const ast::Expr &at);
    void set_property(const Value &target, const Value &key, Value v, const ast::Expr &at);
    // Evaluates the object and key of a member/index assignment target.
    void resolve_target(const ast::Expr &target, Value &object, Value &key);

    void charge_bytes(uint64_t n);
    // Throws when `v` already reaches `container`.
    void reject_cycle(const Value &container, const Value &v, const ast::Expr &at);
    void charge(const ast::Expr &at);
    void charge(const ast::Stmt &at);
    [[noreturn]] void fail(const std::string &msg, const ast::Expr &at) const;

    uint64_t m_budget;
    uint64_t m_steps{0};
    uint64_t m_memory_budget;
    uint64_t m_bytes{0};
    Value m_return;
    std::unordered_map<std::string, Value> m_globals;
    std::unordered_map<std::string, Value> m_locals;
};

} // namespace duel::sandbox
