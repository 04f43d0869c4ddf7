// SPDX-License-Identifier: Apache-2.0
// parser.hpp - Recursive-descent parser producing the behavior AST
#pragma once
#include "engine/sandbox/ast.hpp"

#include <memory>
#include <string_view>

namespace duel::sandbox {

// Maximum nesting of expressions/statements accepted before the parser gives up.
inline constexpr int kMaxParseDepth = 200;
// Maximum height of a single expression tree.
inline constexpr int kMaxExprHeight = 256;

// Throws CompileError (with line/column) on any syntax error or unsupported construct.
std::unique_ptr<ast::Program> parse_program(std::string_view source);

} // namespace duel::sandbox
