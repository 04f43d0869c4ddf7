// SPDX-License-Identifier: Apache-2.0
#include "engine/sandbox/lexer.hpp"

#include "engine/sandbox/errors.hpp"

#include <array>
#include <cctype>
#include <cstdlib>

namespace duel::sandbox {

namespace {

constexpr std::array<std::string_view, 28> kKeywords = {
    "var",      "let",    "const",  "if",     "else",     "while",  "for",        "return",    "break",   "continue",
    "true",     "false",  "null",   "undefined", "typeof", "throw", "function",  "new",       "this",    "class",
    "delete",   "in",     "instanceof", "do",  "switch",  "try",    "import",     "with"};

// Longest first so the scanner can take the first prefix match.
constexpr std::array<std::string_view, 36> kPunctuators = {
    "===", "!==", "==", "!=", "<=", ">=", "&&", "||", "++", "--", "+=", "-=", "*=", "/=", "%=", "=>", "{", "}",
    "(",   ")",   "[",  "]",  ";",  ",",  ".",  ":",  "?",  "+",  "-",  "*",  "/",  "%",  "<",  ">",  "=",  "!"};

class Scanner
{
public:
    explicit Scanner(std::string_view src) : m_src(src) {}

    std::vector<Token> run()
    {
        std::vector<Token> out;
        for (;;) {
            skip_space_and_comments();
            Token t;
            t.line = m_line;
            t.column = m_col;
            if (m_pos >= m_src.size()) {
                t.kind = TokenKind::end;
                out.push_back(std::move(t));
                return out;
            }
            char c = m_src[m_pos];
            if (std::isdigit(static_cast<unsigned char>(c))
                || (c == '.' && m_pos + 1 < m_src.size() && std::isdigit(static_cast<unsigned char>(m_src[m_pos + 1])))) {
                scan_number(t);
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
                scan_word(t);
            } else if (c == '"' || c == '\'') {
                scan_string(t, c);
            } else if (c == '`') {
                fail("template literals are not supported");
            } else {
                scan_punct(t);
            }
            out.push_back(std::move(t));
        }
    }

private:
    [[noreturn]] void fail(const std::string &msg) const
    {
        throw CompileError(msg, m_line, m_col);
    }

    char peek(size_t ahead = 0) const
    {
        return m_pos + ahead < m_src.size() ? m_src[m_pos + ahead] : '\0';
    }

    void advance()
    {
        if (m_src[m_pos] == '\n') {
            ++m_line;
            m_col = 1;
        } else {
            ++m_col;
        }
        ++m_pos;
    }

    void skip_space_and_comments()
    {
        while (m_pos < m_src.size()) {
            char c = m_src[m_pos];
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (m_pos < m_src.size() && m_src[m_pos] != '\n')
                    advance();
            } else if (c == '/' && peek(1) == '*') {
                int line = m_line, col = m_col;
                advance();
                advance();
                while (m_pos < m_src.size() && !(m_src[m_pos] == '*' && peek(1) == '/'))
                    advance();
                if (m_pos >= m_src.size())
                    throw CompileError("unterminated block comment", line, col);
                advance();
                advance();
            } else {
                return;
            }
        }
    }

    void scan_number(Token &t)
    {
        size_t start = m_pos;
        if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
            advance();
            advance();
            size_t digits = m_pos;
            while (std::isxdigit(static_cast<unsigned char>(peek())))
                advance();
            if (m_pos == digits)
                fail("malformed hexadecimal literal");
            t.number = static_cast<double>(std::strtoull(std::string(m_src.substr(digits, m_pos - digits)).c_str(), nullptr, 16));
        } else {
            while (std::isdigit(static_cast<unsigned char>(peek())))
                advance();
            if (peek() == '.') {
                advance();
                while (std::isdigit(static_cast<unsigned char>(peek())))
                    advance();
            }
            if (peek() == 'e' || peek() == 'E') {
                advance();
                if (peek() == '+' || peek() == '-')
                    advance();
                if (!std::isdigit(static_cast<unsigned char>(peek())))
                    fail("malformed exponent in number literal");
                while (std::isdigit(static_cast<unsigned char>(peek())))
                    advance();
            }
            t.number = std::strtod(std::string(m_src.substr(start, m_pos - start)).c_str(), nullptr);
        }
        if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_')
            fail("identifier starts immediately after number");
        t.kind = TokenKind::number;
        t.text = std::string(m_src.substr(start, m_pos - start));
    }

    void scan_word(Token &t)
    {
        size_t start = m_pos;
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '$')
            advance();
        t.text = std::string(m_src.substr(start, m_pos - start));
        t.kind = is_keyword(t.text) ? TokenKind::keyword : TokenKind::identifier;
    }

    void scan_string(Token &t, char quote)
    {
        advance();
        std::string out;
        for (;;) {
            if (m_pos >= m_src.size() || peek() == '\n')
                fail("unterminated string literal");
            char c = peek();
            advance();
            if (c == quote)
                break;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (m_pos >= m_src.size())
                fail("unterminated string literal");
            char e = peek();
            advance();
            switch (e) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case '0':
                    out += '\0';
                    break;
                default:
                    out += e; // \\ \' \" and anything else verbatim
                    break;
            }
        }
        t.kind = TokenKind::string;
        t.text = std::move(out);
    }

    void scan_punct(Token &t)
    {
        std::string_view rest = m_src.substr(m_pos);
        for (std::string_view p : kPunctuators) {
            if (rest.substr(0, p.size()) == p) {
                if (p == "=>")
                    fail("arrow functions are not supported");
                for (size_t i = 0; i < p.size(); ++i)
                    advance();
                t.kind = TokenKind::punct;
                t.text = std::string(p);
                return;
            }
        }
        fail(std::string("unexpected character '") + m_src[m_pos] + "'");
    }

    std::string_view m_src;
    size_t m_pos{0};
    int m_line{1};
    int m_col{1};
};

} // namespace

bool is_keyword(std::string_view word)
{
    for (std::string_view k : kKeywords)
        if (k == word)
            return true;
    return false;
}

std::vector<Token> tokenize(std::string_view source)
{
    return Scanner(source).run();
}

} // namespace duel::sandbox
