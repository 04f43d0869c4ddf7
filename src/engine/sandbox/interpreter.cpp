// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/interpreter.hpp"

#include "engine/sandbox/errors.hpp"

#include <cmath>
#include <unordered_set>
#include <vector>

namespace duel::sandbox {

namespace {

// Bounds on values a script can grow inside its step budget.
constexpr size_t kMaxStringLength = 64 * 1024;
constexpr size_t kMaxArrayLength = 4096;

bool as_array_index(const Value &key, size_t &index)
{
    if (!key.is_number())
        return false;
    double d = key.as_number();
    if (!(d >= 0.0) || d != std::floor(d) || d > 1e9)
        return false;
    index = static_cast<size_t>(d);
    return true;
}

std::string key_string(const Value &key)
{
    return key.to_display_string();
}

// Bytes charged for holding `v` in a slot.
uint64_t footprint(const Value &v)
{
    return sizeof(Value) + (v.is_string() ? v.as_string().size() : 0);
}

const void *container_id(const Value &v)
{
    if (v.is_object())
        return v.as_object().get();
    return v.as_array().get();
}

} // namespace

Interpreter::Interpreter(uint64_t step_budget, uint64_t memory_budget)
    : m_budget(step_budget)
    , m_memory_budget(memory_budget)
{
}

void Interpreter::define_global(const std::string &name, Value v)
{
    m_globals[name] = std::move(v);
}

Value Interpreter::run(const ast::Program &program)
{
    m_return = Value();
    for (const auto &stmt : program.body)
        if (exec(*stmt) == Flow::return_value)
            break;
    return m_return;
}

void Interpreter::charge(const ast::Expr &)
{
    if (++m_steps > m_budget)
        throw BudgetExceeded(m_budget);
}

void Interpreter::charge(const ast::Stmt &)
{
    if (++m_steps > m_budget)
        throw BudgetExceeded(m_budget);
}

void Interpreter::charge_bytes(uint64_t n)
{
    m_bytes += n;
    if (m_bytes > m_memory_budget)
        throw BudgetExceeded("memory", m_memory_budget);
}

void Interpreter::reject_cycle(const Value &container, const Value &v, const ast::Expr &at)
{
    if (!v.is_object() && !v.is_array())
        return;
    const void *target = container_id(container);
    std::vector<const Value *> pending{&v};
    std::unordered_set<const void *> seen;
    while (!pending.empty()) {
        const Value *cur = pending.back();
        pending.pop_back();
        const void *id = container_id(*cur);
        if (id == target)
            fail("cannot store a container inside itself", at);
        if (!seen.insert(id).second)
            continue;
        charge(at);
        if (cur->is_object()) {
            for (const auto &[key, field] : cur->as_object()->fields)
                if (field.is_object() || field.is_array())
                    pending.push_back(&field);
        } else {
            for (const auto &item : cur->as_array()->items)
                if (item.is_object() || item.is_array())
                    pending.push_back(&item);
        }
    }
}

void Interpreter::fail(const std::string &msg, const ast::Expr &at) const
{
    throw RuntimeError(msg, at.line, at.column);
}

Interpreter::Flow Interpreter::exec_loop_body(const ast::Stmt &body, bool &stop)
{
    Flow f = exec(body);
    stop = f == Flow::break_loop || f == Flow::return_value;
    return f == Flow::return_value ? f : Flow::normal;
}

Interpreter::Flow Interpreter::exec(const ast::Stmt &s)
{
    using ast::StmtKind;
    charge(s);
    switch (s.kind) {
        case StmtKind::empty:
            return Flow::normal;
        case StmtKind::expression:
            eval(*s.expr);
            return Flow::normal;
        case StmtKind::declaration:
            for (const auto &[name, init] : s.decls)
                m_locals[name] = init ? eval(*init) : Value();
            return Flow::normal;
        case StmtKind::block:
            for (const auto &child : s.body) {
                Flow f = exec(*child);
                if (f != Flow::normal)
                    return f;
            }
            return Flow::normal;
        case StmtKind::if_else:
            if (eval(*s.expr).truthy())
                return exec(*s.then_branch);
            if (s.else_branch)
                return exec(*s.else_branch);
            return Flow::normal;
        case StmtKind::while_loop:
            while (eval(*s.expr).truthy()) {
                bool stop = false;
                Flow f = exec_loop_body(*s.then_branch, stop);
                if (stop)
                    return f;
            }
            return Flow::normal;
        case StmtKind::for_loop:
            if (s.init)
                exec(*s.init);
            for (;;) {
                if (s.expr && !eval(*s.expr).truthy())
                    break;
                bool stop = false;
                Flow f = exec_loop_body(*s.then_branch, stop);
                if (stop)
                    return f;
                if (s.update)
                    eval(*s.update);
                else
                    charge(s); // `for (;;) {}` still pays per iteration
            }
            return Flow::normal;
        case StmtKind::return_stmt:
            m_return = s.expr ? eval(*s.expr) : Value();
            return Flow::return_value;
        case StmtKind::break_stmt:
            return Flow::break_loop;
        case StmtKind::continue_stmt:
            return Flow::continue_loop;
        case StmtKind::throw_stmt: {
            Value thrown = eval(*s.expr);
            throw RuntimeError("uncaught exception: " + thrown.to_display_string(), s.line, s.column);
        }
    }
    return Flow::normal;
}

Value Interpreter::eval(const ast::Expr &e)
{
    using ast::ExprKind;
    using ast::Op;
    charge(e);
    switch (e.kind) {
        case ExprKind::number:
            return Value(e.number);
        case ExprKind::string:
            return Value(e.text);
        case ExprKind::boolean:
            return Value(e.flag);
        case ExprKind::null:
            return Value(Null{});
        case ExprKind::undefined:
            return Value();
        case ExprKind::identifier:
            return load_variable(e);
        case ExprKind::object: {
            auto obj = std::make_shared<ObjectData>();
            for (size_t i = 0; i < e.keys.size(); ++i) {
                Value v = eval(*e.list[i]);
                charge_bytes(e.keys[i].size() + footprint(v));
                obj->fields[e.keys[i]] = std::move(v);
            }
            return Value(std::move(obj));
        }
        case ExprKind::array: {
            auto arr = std::make_shared<ArrayData>();
            arr->items.reserve(e.list.size());
            for (const auto &item : e.list) {
                Value v = eval(*item);
                charge_bytes(footprint(v));
                arr->items.push_back(std::move(v));
            }
            return Value(std::move(arr));
        }
        case ExprKind::member: {
            Value target = eval(*e.a);
            return get_property(target, Value(e.text), e);
        }
        case ExprKind::index: {
            Value target = eval(*e.a);
            Value key = eval(*e.b);
            return get_property(target, key, e);
        }
        case ExprKind::call:
            return eval_call(e);
        case ExprKind::unary: {
            if (e.op == Op::type_of && e.a->kind == ExprKind::identifier && !m_locals.count(e.a->text)
                && !m_globals.count(e.a->text))
                return Value("undefined");
            Value v = eval(*e.a);
            switch (e.op) {
                case Op::neg:
                    return Value(-v.to_number());
                case Op::plus:
                    return Value(v.to_number());
                case Op::logical_not:
                    return Value(!v.truthy());
                case Op::type_of:
                    return Value(v.type_name());
                default:
                    fail("bad unary operator", e);
            }
        }
        case ExprKind::binary: {
            Value lhs = eval(*e.a);
            Value rhs = eval(*e.b);
            return eval_binary(e.op, lhs, rhs, e);
        }
        case ExprKind::logical: {
            Value lhs = eval(*e.a);
            if (e.op == Op::logical_and)
                return lhs.truthy() ? eval(*e.b) : lhs;
            return lhs.truthy() ? lhs : eval(*e.b);
        }
        case ExprKind::conditional:
            return eval(*e.a).truthy() ? eval(*e.b) : eval(*e.c);
        case ExprKind::assign:
            return eval_assign(e);
        case ExprKind::update:
            return eval_update(e);
    }
    return Value();
}

Value Interpreter::eval_binary(ast::Op op, const Value &lhs, const Value &rhs, const ast::Expr &at)
{
    using ast::Op;
    switch (op) {
        case Op::add: {
            bool lnum = lhs.type() != Value::Type::string && lhs.type() < Value::Type::object;
            bool rnum = rhs.type() != Value::Type::string && rhs.type() < Value::Type::object;
            if (lnum && rnum)
                return Value(lhs.to_number() + rhs.to_number());
            std::string out = lhs.to_display_string();
            out += rhs.to_display_string();
            if (out.size() > kMaxStringLength)
                fail("string too long", at);
            charge_bytes(out.size());
            return Value(std::move(out));
        }
        case Op::sub:
            return Value(lhs.to_number() - rhs.to_number());
        case Op::mul:
            return Value(lhs.to_number() * rhs.to_number());
        case Op::div:
            return Value(lhs.to_number() / rhs.to_number());
        case Op::mod:
            return Value(std::fmod(lhs.to_number(), rhs.to_number()));
        case Op::lt:
        case Op::le:
        case Op::gt:
        case Op::ge: {
            if (lhs.is_string() && rhs.is_string()) {
                int c = lhs.as_string().compare(rhs.as_string());
                return Value(op == Op::lt ? c < 0 : op == Op::le ? c <= 0 : op == Op::gt ? c > 0 : c >= 0);
            }
            double l = lhs.to_number();
            double r = rhs.to_number();
            return Value(op == Op::lt ? l < r : op == Op::le ? l <= r : op == Op::gt ? l > r : l >= r);
        }
        case Op::eq:
            return Value(lhs.loose_equals(rhs));
        case Op::ne:
            return Value(!lhs.loose_equals(rhs));
        case Op::strict_eq:
            return Value(lhs.strict_equals(rhs));
        case Op::strict_ne:
            return Value(!lhs.strict_equals(rhs));
        default:
            fail("bad binary operator", at);
    }
}

Value Interpreter::eval_call(const ast::Expr &e)
{
    using ast::ExprKind;
    const ast::Expr &callee = *e.a;
    Value fn;
    std::string name;
    if (callee.kind == ExprKind::member || callee.kind == ExprKind::index) {
        Value object = eval(*callee.a);
        Value key = callee.kind == ExprKind::member ? Value(callee.text) : eval(*callee.b);
        name = key_string(key);
        fn = get_property(object, key, callee);
    } else {
        fn = eval(callee);
        name = callee.kind == ExprKind::identifier ? callee.text : "expression";
    }
    std::vector<Value> args;
    args.reserve(e.list.size());
    for (const auto &arg : e.list)
        args.push_back(eval(*arg));
    if (!fn.is_function())
        fail("'" + name + "' is not a function", e);
    try {
        return fn.as_function()->fn(std::span<const Value>(args));
    } catch (const BudgetExceeded &) {
        throw;
    } catch (const RuntimeError &err) {
        if (err.line() > 0)
            throw;
        throw RuntimeError(err.what(), e.line, e.column); // attach the call site
    }
}

void Interpreter::resolve_target(const ast::Expr &target, Value &object, Value &key)
{
    object = eval(*target.a);
    key = target.kind == ast::ExprKind::member ? Value(target.text) : eval(*target.b);
}

Value Interpreter::eval_assign(const ast::Expr &e)
{
    const ast::Expr &target = *e.a;
    if (target.kind == ast::ExprKind::identifier) {
        Value v;
        if (e.op == ast::Op::assign) {
            v = eval(*e.b);
        } else {
            Value current = load_variable(target);
            Value rhs = eval(*e.b);
            v = eval_binary(e.op, current, rhs, e);
        }
        store_variable(target, v);
        return v;
    }
    Value object, key;
    resolve_target(target, object, key);
    Value v;
    if (e.op == ast::Op::assign) {
        v = eval(*e.b);
    } else {
        Value current = get_property(object, key, target);
        Value rhs = eval(*e.b);
        v = eval_binary(e.op, current, rhs, e);
    }
    set_property(object, key, v, target);
    return v;
}

Value Interpreter::eval_update(const ast::Expr &e)
{
    const ast::Expr &target = *e.a;
    double delta = e.op == ast::Op::inc ? 1.0 : -1.0;
    if (target.kind == ast::ExprKind::identifier) {
        double old = load_variable(target).to_number();
        store_variable(target, Value(old + delta));
        return Value(e.flag ? old + delta : old);
    }
    Value object, key;
    resolve_target(target, object, key);
    double old = get_property(object, key, target).to_number();
    set_property(object, key, Value(old + delta), target);
    return Value(e.flag ? old + delta : old);
}

Value Interpreter::load_variable(const ast::Expr &ident)
{
    auto it = m_locals.find(ident.text);
    if (it != m_locals.end())
        return it->second;
    auto git = m_globals.find(ident.text);
    if (git != m_globals.end())
        return git->second;
    fail("'" + ident.text + "' is not defined", ident);
}

void Interpreter::store_variable(const ast::Expr &ident, Value v)
{
    auto it = m_locals.find(ident.text);
    if (it != m_locals.end()) {
        it->second = std::move(v);
        return;
    }
    if (m_globals.count(ident.text))
        fail("cannot assign to read-only global '" + ident.text + "'", ident);
    fail("assignment to undeclared variable '" + ident.text + "'", ident);
}

Value Interpreter::get_property(const Value &target, const Value &key, const ast::Expr &at)
{
    switch (target.type()) {
        case Value::Type::undefined:
        case Value::Type::null:
            fail("cannot read property '" + key_string(key) + "' of " + target.to_display_string(), at);
        case Value::Type::object: {
            const auto &fields = target.as_object()->fields;
            auto it = fields.find(key_string(key));
            return it != fields.end() ? it->second : Value();
        }
        case Value::Type::array: {
            const auto &items = target.as_array()->items;
            size_t index;
            if (as_array_index(key, index))
                return index < items.size() ? items[index] : Value();
            if (key.is_string() && key.as_string() == "length")
                return Value(static_cast<double>(items.size()));
            return Value();
        }
        case Value::Type::string: {
            const std::string &s = target.as_string();
            size_t index;
            if (as_array_index(key, index))
                return index < s.size() ? Value(std::string(1, s[index])) : Value();
            if (key.is_string() && key.as_string() == "length")
                return Value(static_cast<double>(s.size()));
            return Value();
        }
        default:
            return Value();
    }
}

void Interpreter::set_property(const Value &target, const Value &key, Value v, const ast::Expr &at)
{
    switch (target.type()) {
        case Value::Type::object: {
            ObjectData &obj = *target.as_object();
            if (obj.frozen)
                fail("cannot modify read-only object", at);
            reject_cycle(target, v, at);
            std::string name = key_string(key);
            charge_bytes(name.size() + footprint(v));
            obj.fields[std::move(name)] = std::move(v);
            return;
        }
        case Value::Type::array: {
            size_t index;
            if (!as_array_index(key, index))
                fail("invalid array index '" + key_string(key) + "'", at);
            if (index >= kMaxArrayLength)
                fail("array index " + key_string(key) + " out of range", at);
            reject_cycle(target, v, at);
            auto &items = target.as_array()->items;
            uint64_t grown = index >= items.size() ? index + 1 - items.size() : 0;
            charge_bytes(grown * sizeof(Value) + footprint(v));
            if (index >= items.size())
                items.resize(index + 1);
            items[index] = std::move(v);
            return;
        }
        default:
            fail("cannot set property '" + key_string(key) + "' of " + target.type_name(), at);
    }
}

} // namespace duel::sandbox
