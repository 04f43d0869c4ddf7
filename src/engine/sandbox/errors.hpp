// SPDX-License-Identifier: Apache-2.0
// errors.hpp - Failures raised by untrusted behavior code
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace duel::sandbox {

// Never escapes execute_behavior / compile_behavior.
class BehaviorError : public std::runtime_error
{
public:
    BehaviorError(const std::string &msg, int line, int column)
        : std::runtime_error(
              line > 0 ? msg + " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")" : msg)
        , m_line(line)
        , m_column(column)
    {
    }

    int line() const
    {
        return m_line;
    }

    int column() const
    {
        return m_column;
    }

private:
    int m_line;
    int m_column;
};

class CompileError : public BehaviorError
{
public:
    using BehaviorError::BehaviorError;
};

class RuntimeError : public BehaviorError
{
public:
    using BehaviorError::BehaviorError;
};

class BudgetExceeded : public RuntimeError
{
public:
    explicit BudgetExceeded(uint64_t budget) : BudgetExceeded("step", budget) {}

    // resource: "step" or "memory"
    BudgetExceeded(const std::string &resource, uint64_t budget)
        : RuntimeError(resource + " budget of " + std::to_string(budget) + " exhausted", 0, 0)
    {
    }
};

} // namespace duel::sandbox
