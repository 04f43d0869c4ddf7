// SPDX-License-Identifier: Apache-2.0
// lexer.hpp - Tokenizer for behavior source text
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace duel::sandbox {

enum class TokenKind
{
    end,
    number,
    string,
    identifier,
    keyword,
    punct
};

struct Token
{
    TokenKind kind{TokenKind::end};
    std::string text; // identifier/keyword/punctuator spelling, decoded string literal
    double number{0.0};
    int line{1};
    int column{1};

    bool is(TokenKind k, std::string_view t) const
    {
        return kind == k && text == t;
    }
};

// Throws CompileError on malformed input. The result always ends with a TokenKind::end token.
std::vector<Token> tokenize(std::string_view source);

bool is_keyword(std::string_view word);

} // namespace duel::sandbox
