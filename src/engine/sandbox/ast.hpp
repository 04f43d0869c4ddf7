// SPDX-License-Identifier: Apache-2.0
// ast.hpp - Syntax tree of the behavior language
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace duel::sandbox::ast {

enum class Op
{
    // arithmetic
    add,
    sub,
    mul,
    div,
    mod,
    // comparison
    lt,
    le,
    gt,
    ge,
    eq,
    ne,
    strict_eq,
    strict_ne,
    // logical
    logical_and,
    logical_or,
    // unary
    neg,
    plus,
    logical_not,
    type_of,
    // assignment / update
    assign,
    inc,
    dec
};

enum class ExprKind
{
    number,
    string,
    boolean,
    null,
    undefined,
    identifier,
    object, // keys + list
    array, // list
    member, // a.text
    index, // a[b]
    call, // a(list)
    unary, // op a
    binary, // a op b
    logical, // a && b, a || b
    conditional, // a ? b : c
    assign, // a op= b; op is assign or the arithmetic op of a compound form
    update // ++a / a++; flag = prefix
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct Expr
{
    ExprKind kind{ExprKind::undefined};
    Op op{Op::add};
    int line{0};
    int column{0};
    int height{1}; // longest path to a leaf
    double number{0.0};
    std::string text; // identifier name, string literal, member name
    bool flag{false}; // boolean literal value, prefix update
    ExprPtr a;
    ExprPtr b;
    ExprPtr c;
    std::vector<ExprPtr> list;
    std::vector<std::string> keys;
};

enum class StmtKind
{
    empty,
    expression,
    declaration,
    block,
    if_else,
    while_loop,
    for_loop,
    return_stmt,
    break_stmt,
    continue_stmt,
    throw_stmt
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;

struct Stmt
{
    StmtKind kind{StmtKind::empty};
    int line{0};
    int column{0};
    ExprPtr expr; // expression / condition / return value / thrown value
    ExprPtr update; // for-loop update
    std::vector<std::pair<std::string, ExprPtr>> decls;
    std::vector<StmtPtr> body; // block statements
    StmtPtr init; // for-loop init
    StmtPtr then_branch; // if / loop body
    StmtPtr else_branch;
};

struct Program
{
    std::vector<StmtPtr> body;
};

} // namespace duel::sandbox::ast
