// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/parser.hpp"

#include "engine/sandbox/errors.hpp"
#include "engine/sandbox/lexer.hpp"

#include <algorithm>
#include <vector>

namespace duel::sandbox {

namespace {

using ast::Expr;
using ast::ExprKind;
using ast::ExprPtr;
using ast::Op;
using ast::Stmt;
using ast::StmtKind;
using ast::StmtPtr;

class Parser
{
public:
    explicit Parser(std::vector<Token> tokens) : m_tokens(std::move(tokens)) {}

    std::unique_ptr<ast::Program> program()
    {
        auto prog = std::make_unique<ast::Program>();
        while (!at_end())
            prog->body.push_back(statement());
        return prog;
    }

private:
    // RAII nesting counter; keeps hostile input from exhausting the native stack.
    class DepthGuard
    {
    public:
        explicit DepthGuard(Parser &p) : m_p(p)
        {
            if (++m_p.m_depth > kMaxParseDepth)
                m_p.fail("nesting too deep");
        }
        ~DepthGuard()
        {
            --m_p.m_depth;
        }

    private:
        Parser &m_p;
    };

    const Token &peek(size_t ahead = 0) const
    {
        size_t i = m_pos + ahead;
        return i < m_tokens.size() ? m_tokens[i] : m_tokens.back();
    }

    const Token &previous() const
    {
        return m_tokens[m_pos > 0 ? m_pos - 1 : 0];
    }

    bool at_end() const
    {
        return peek().kind == TokenKind::end;
    }

    const Token &next()
    {
        const Token &t = peek();
        if (!at_end())
            ++m_pos;
        return t;
    }

    bool check_punct(std::string_view p) const
    {
        return peek().is(TokenKind::punct, p);
    }

    bool check_keyword(std::string_view k) const
    {
        return peek().is(TokenKind::keyword, k);
    }

    bool match_punct(std::string_view p)
    {
        if (!check_punct(p))
            return false;
        ++m_pos;
        return true;
    }

    bool match_keyword(std::string_view k)
    {
        if (!check_keyword(k))
            return false;
        ++m_pos;
        return true;
    }

    [[noreturn]] void fail(const std::string &msg) const
    {
        throw CompileError(msg, peek().line, peek().column);
    }

    void expect_punct(std::string_view p)
    {
        if (!match_punct(p))
            fail("expected '" + std::string(p) + "' but found " + describe(peek()));
    }

    static std::string describe(const Token &t)
    {
        switch (t.kind) {
            case TokenKind::end:
                return "end of input";
            case TokenKind::string:
                return "string literal";
            case TokenKind::number:
                return "number '" + t.text + "'";
            default:
                return "'" + t.text + "'";
        }
    }

    // Semicolons may be omitted before '}', at end of input or at a line break.
    void consume_semicolon()
    {
        if (match_punct(";"))
            return;
        if (check_punct("}") || at_end() || peek().line > previous().line)
            return;
        fail("expected ';' but found " + describe(peek()));
    }

    template <typename Node>
    std::unique_ptr<Node> make(const Token &at)
    {
        auto n = std::make_unique<Node>();
        n->line = at.line;
        n->column = at.column;
        return n;
    }

    // Records the subtree height. Left-associative chains are built in loops rather than
    // by recursion, so this is what bounds evaluation depth for `a + b + c + ...`.
    ExprPtr finish(ExprPtr e)
    {
        int h = 0;
        for (const ExprPtr *child : {&e->a, &e->b, &e->c})
            if (*child)
                h = std::max(h, (*child)->height);
        for (const ExprPtr &item : e->list)
            h = std::max(h, item->height);
        e->height = h + 1;
        if (e->height > kMaxExprHeight)
            throw CompileError("expression too deeply nested", e->line, e->column);
        return e;
    }

    // ---- statements ---------------------------------------------------

    StmtPtr statement()
    {
        DepthGuard guard(*this);
        const Token &t = peek();
        if (t.kind == TokenKind::punct) {
            if (t.text == "{")
                return block();
            if (t.text == ";") {
                next();
                return make<Stmt>(t);
            }
        }
        if (t.kind == TokenKind::keyword) {
            if (t.text == "var" || t.text == "let" || t.text == "const") {
                StmtPtr s = declaration();
                consume_semicolon();
                return s;
            }
            if (t.text == "if")
                return if_statement();
            if (t.text == "while")
                return while_statement();
            if (t.text == "for")
                return for_statement();
            if (t.text == "return") {
                next();
                auto s = make<Stmt>(t);
                s->kind = StmtKind::return_stmt;
                if (!check_punct(";") && !check_punct("}") && !at_end() && peek().line == t.line)
                    s->expr = expression();
                consume_semicolon();
                return s;
            }
            if (t.text == "break" || t.text == "continue") {
                if (m_loop_depth == 0)
                    fail("'" + t.text + "' outside of a loop");
                next();
                auto s = make<Stmt>(t);
                s->kind = t.text == "break" ? StmtKind::break_stmt : StmtKind::continue_stmt;
                consume_semicolon();
                return s;
            }
            if (t.text == "throw") {
                next();
                auto s = make<Stmt>(t);
                s->kind = StmtKind::throw_stmt;
                s->expr = expression();
                consume_semicolon();
                return s;
            }
            if (t.text == "else")
                fail("'else' without matching 'if'");
        }
        auto s = make<Stmt>(t);
        s->kind = StmtKind::expression;
        s->expr = expression();
        consume_semicolon();
        return s;
    }

    StmtPtr block()
    {
        auto s = make<Stmt>(peek());
        s->kind = StmtKind::block;
        expect_punct("{");
        while (!check_punct("}")) {
            if (at_end())
                fail("unterminated block, expected '}'");
            s->body.push_back(statement());
        }
        next();
        return s;
    }

    StmtPtr declaration()
    {
        const Token &kw = next();
        bool is_const = kw.text == "const";
        auto s = make<Stmt>(kw);
        s->kind = StmtKind::declaration;
        do {
            const Token &name = peek();
            if (name.kind != TokenKind::identifier)
                fail("expected variable name but found " + describe(name));
            next();
            ExprPtr init;
            if (match_punct("="))
                init = assignment();
            else if (is_const)
                fail("missing initializer in const declaration");
            s->decls.emplace_back(name.text, std::move(init));
        } while (match_punct(","));
        return s;
    }

    StmtPtr if_statement()
    {
        auto s = make<Stmt>(next());
        s->kind = StmtKind::if_else;
        expect_punct("(");
        s->expr = expression();
        expect_punct(")");
        s->then_branch = statement();
        if (match_keyword("else"))
            s->else_branch = statement();
        return s;
    }

    StmtPtr loop_body()
    {
        ++m_loop_depth;
        StmtPtr body = statement();
        --m_loop_depth;
        return body;
    }

    StmtPtr while_statement()
    {
        auto s = make<Stmt>(next());
        s->kind = StmtKind::while_loop;
        expect_punct("(");
        s->expr = expression();
        expect_punct(")");
        s->then_branch = loop_body();
        return s;
    }

    StmtPtr for_statement()
    {
        auto s = make<Stmt>(next());
        s->kind = StmtKind::for_loop;
        expect_punct("(");
        if (!check_punct(";")) {
            if (check_keyword("var") || check_keyword("let") || check_keyword("const")) {
                s->init = declaration();
            } else {
                auto init = make<Stmt>(peek());
                init->kind = StmtKind::expression;
                init->expr = expression();
                s->init = std::move(init);
            }
        }
        expect_punct(";");
        if (!check_punct(";"))
            s->expr = expression();
        expect_punct(";");
        if (!check_punct(")"))
            s->update = expression();
        expect_punct(")");
        s->then_branch = loop_body();
        return s;
    }

    // ---- expressions --------------------------------------------------

    ExprPtr expression()
    {
        return assignment();
    }

    static bool assignable(const Expr &e)
    {
        return e.kind == ExprKind::identifier || e.kind == ExprKind::member || e.kind == ExprKind::index;
    }

    ExprPtr assignment()
    {
        DepthGuard guard(*this);
        ExprPtr lhs = conditional();
        const Token &t = peek();
        if (t.kind != TokenKind::punct)
            return lhs;
        Op op;
        if (t.text == "=")
            op = Op::assign;
        else if (t.text == "+=")
            op = Op::add;
        else if (t.text == "-=")
            op = Op::sub;
        else if (t.text == "*=")
            op = Op::mul;
        else if (t.text == "/=")
            op = Op::div;
        else if (t.text == "%=")
            op = Op::mod;
        else
            return lhs;
        if (!assignable(*lhs))
            fail("invalid assignment target");
        next();
        auto e = make<Expr>(t);
        e->kind = ExprKind::assign;
        e->op = op;
        e->a = std::move(lhs);
        e->b = assignment();
        return finish(std::move(e));
    }

    ExprPtr conditional()
    {
        ExprPtr cond = logical_or();
        if (!check_punct("?"))
            return cond;
        auto e = make<Expr>(next());
        e->kind = ExprKind::conditional;
        e->a = std::move(cond);
        e->b = assignment();
        expect_punct(":");
        e->c = assignment();
        return finish(std::move(e));
    }

    ExprPtr binary_node(ExprKind kind, Op op, const Token &at, ExprPtr lhs, ExprPtr rhs)
    {
        auto e = make<Expr>(at);
        e->kind = kind;
        e->op = op;
        e->a = std::move(lhs);
        e->b = std::move(rhs);
        return finish(std::move(e));
    }

    ExprPtr logical_or()
    {
        ExprPtr lhs = logical_and();
        while (check_punct("||")) {
            const Token &t = next();
            lhs = binary_node(ExprKind::logical, Op::logical_or, t, std::move(lhs), logical_and());
        }
        return lhs;
    }

    ExprPtr logical_and()
    {
        ExprPtr lhs = equality();
        while (check_punct("&&")) {
            const Token &t = next();
            lhs = binary_node(ExprKind::logical, Op::logical_and, t, std::move(lhs), equality());
        }
        return lhs;
    }

    ExprPtr equality()
    {
        ExprPtr lhs = relational();
        for (;;) {
            Op op;
            if (check_punct("=="))
                op = Op::eq;
            else if (check_punct("!="))
                op = Op::ne;
            else if (check_punct("==="))
                op = Op::strict_eq;
            else if (check_punct("!=="))
                op = Op::strict_ne;
            else
                return lhs;
            const Token &t = next();
            lhs = binary_node(ExprKind::binary, op, t, std::move(lhs), relational());
        }
    }

    ExprPtr relational()
    {
        ExprPtr lhs = additive();
        for (;;) {
            Op op;
            if (check_punct("<"))
                op = Op::lt;
            else if (check_punct("<="))
                op = Op::le;
            else if (check_punct(">"))
                op = Op::gt;
            else if (check_punct(">="))
                op = Op::ge;
            else if (check_keyword("in") || check_keyword("instanceof"))
                fail("operator '" + peek().text + "' is not supported");
            else
                return lhs;
            const Token &t = next();
            lhs = binary_node(ExprKind::binary, op, t, std::move(lhs), additive());
        }
    }

    ExprPtr additive()
    {
        ExprPtr lhs = multiplicative();
        for (;;) {
            Op op;
            if (check_punct("+"))
                op = Op::add;
            else if (check_punct("-"))
                op = Op::sub;
            else
                return lhs;
            const Token &t = next();
            lhs = binary_node(ExprKind::binary, op, t, std::move(lhs), multiplicative());
        }
    }

    ExprPtr multiplicative()
    {
        ExprPtr lhs = unary();
        for (;;) {
            Op op;
            if (check_punct("*"))
                op = Op::mul;
            else if (check_punct("/"))
                op = Op::div;
            else if (check_punct("%"))
                op = Op::mod;
            else
                return lhs;
            const Token &t = next();
            lhs = binary_node(ExprKind::binary, op, t, std::move(lhs), unary());
        }
    }

    ExprPtr unary()
    {
        DepthGuard guard(*this);
        const Token &t = peek();
        Op op;
        if (t.is(TokenKind::punct, "-"))
            op = Op::neg;
        else if (t.is(TokenKind::punct, "+"))
            op = Op::plus;
        else if (t.is(TokenKind::punct, "!"))
            op = Op::logical_not;
        else if (t.is(TokenKind::keyword, "typeof"))
            op = Op::type_of;
        else if (t.is(TokenKind::punct, "++") || t.is(TokenKind::punct, "--")) {
            next();
            auto e = make<Expr>(t);
            e->kind = ExprKind::update;
            e->op = t.text == "++" ? Op::inc : Op::dec;
            e->flag = true;
            e->a = unary();
            if (!assignable(*e->a))
                fail("invalid increment/decrement operand");
            return finish(std::move(e));
        } else
            return postfix();
        next();
        auto e = make<Expr>(t);
        e->kind = ExprKind::unary;
        e->op = op;
        e->a = unary();
        return finish(std::move(e));
    }

    ExprPtr postfix()
    {
        ExprPtr operand = call_or_member();
        const Token &t = peek();
        if ((t.is(TokenKind::punct, "++") || t.is(TokenKind::punct, "--")) && t.line == previous().line) {
            if (!assignable(*operand))
                fail("invalid increment/decrement operand");
            next();
            auto e = make<Expr>(t);
            e->kind = ExprKind::update;
            e->op = t.text == "++" ? Op::inc : Op::dec;
            e->flag = false;
            e->a = std::move(operand);
            return finish(std::move(e));
        }
        return operand;
    }

    ExprPtr call_or_member()
    {
        ExprPtr e = primary();
        for (;;) {
            const Token &t = peek();
            if (t.is(TokenKind::punct, ".")) {
                next();
                const Token &name = peek();
                if (name.kind != TokenKind::identifier && name.kind != TokenKind::keyword)
                    fail("expected property name after '.'");
                next();
                auto m = make<Expr>(t);
                m->kind = ExprKind::member;
                m->a = std::move(e);
                m->text = name.text;
                e = finish(std::move(m));
            } else if (t.is(TokenKind::punct, "[")) {
                next();
                auto m = make<Expr>(t);
                m->kind = ExprKind::index;
                m->a = std::move(e);
                m->b = expression();
                expect_punct("]");
                e = finish(std::move(m));
            } else if (t.is(TokenKind::punct, "(")) {
                next();
                auto c = make<Expr>(t);
                c->kind = ExprKind::call;
                c->a = std::move(e);
                if (!check_punct(")")) {
                    do {
                        if (check_punct(")"))
                            break; // trailing comma
                        c->list.push_back(assignment());
                    } while (match_punct(","));
                }
                expect_punct(")");
                e = finish(std::move(c));
            } else {
                return e;
            }
        }
    }

    ExprPtr primary()
    {
        DepthGuard guard(*this);
        const Token &t = peek();
        switch (t.kind) {
            case TokenKind::number: {
                next();
                auto e = make<Expr>(t);
                e->kind = ExprKind::number;
                e->number = t.number;
                return e;
            }
            case TokenKind::string: {
                next();
                auto e = make<Expr>(t);
                e->kind = ExprKind::string;
                e->text = t.text;
                return e;
            }
            case TokenKind::identifier: {
                next();
                auto e = make<Expr>(t);
                e->kind = ExprKind::identifier;
                e->text = t.text;
                return e;
            }
            case TokenKind::keyword: {
                auto e = make<Expr>(t);
                if (t.text == "true" || t.text == "false") {
                    e->kind = ExprKind::boolean;
                    e->flag = t.text == "true";
                } else if (t.text == "null") {
                    e->kind = ExprKind::null;
                } else if (t.text == "undefined") {
                    e->kind = ExprKind::undefined;
                } else {
                    fail("'" + t.text + "' is not supported in behavior code");
                }
                next();
                return e;
            }
            case TokenKind::punct:
                if (t.text == "(") {
                    next();
                    ExprPtr inner = expression();
                    expect_punct(")");
                    return inner;
                }
                if (t.text == "[")
                    return array_literal();
                if (t.text == "{")
                    return object_literal();
                break;
            case TokenKind::end:
                fail("unexpected end of input");
        }
        fail("unexpected " + describe(t));
    }

    ExprPtr array_literal()
    {
        auto e = make<Expr>(next());
        e->kind = ExprKind::array;
        while (!check_punct("]")) {
            e->list.push_back(assignment());
            if (!match_punct(","))
                break;
        }
        expect_punct("]");
        return finish(std::move(e));
    }

    ExprPtr object_literal()
    {
        auto e = make<Expr>(next());
        e->kind = ExprKind::object;
        while (!check_punct("}")) {
            const Token &key = peek();
            std::string name;
            if (key.kind == TokenKind::identifier || key.kind == TokenKind::keyword || key.kind == TokenKind::string)
                name = key.text;
            else if (key.kind == TokenKind::number)
                name = key.text;
            else
                fail("expected property name but found " + describe(key));
            next();
            if (match_punct(":")) {
                e->list.push_back(assignment());
            } else if (key.kind == TokenKind::identifier) {
                auto ref = make<Expr>(key); // shorthand {x}
                ref->kind = ExprKind::identifier;
                ref->text = name;
                e->list.push_back(std::move(ref));
            } else {
                fail("expected ':' after property name");
            }
            e->keys.push_back(std::move(name));
            if (!match_punct(","))
                break;
        }
        expect_punct("}");
        return finish(std::move(e));
    }

    std::vector<Token> m_tokens;
    size_t m_pos{0};
    int m_depth{0};
    int m_loop_depth{0};
};

} // namespace

std::unique_ptr<ast::Program> parse_program(std::string_view source)
{
    return Parser(tokenize(source)).program();
}

} // namespace duel::sandbox
