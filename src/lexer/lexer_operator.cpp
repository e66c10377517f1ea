//! # Lexer - Operators and Delimiters
//!
//! `(`, `)` and `,` get their own token kinds since rules track nesting and
//! argument boundaries with them. Everything else is an `Operator`; the
//! longest operator in the table wins so that `->`, `=>` and `...` stay
//! single tokens.

#include "lexer/lexer.hpp"

#include <array>

namespace domainfix::lexer {

namespace {

// Longest first within each starting character
constexpr std::array<std::string_view, 36> MULTI_CHAR_OPERATORS = {
    "<<=", ">>=", "**=", "...", "<=>", "===", "!==", "??=", "?->", "->", "=>",
    "::",  "==",  "!=",  "<>",  "<=",  ">=",  "&&",  "||",  "++",  "--", "+=",
    "-=",  "*=",  "/=",  ".=",  "%=",  "&=",  "|=",  "^=",  "<<",  ">>", "??",
    "**",  "#[",  "?:",
};

} // anonymous namespace

auto Lexer::lex_operator() -> Token {
    char c = advance();

    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case ',':
        return make_token(TokenKind::Comma);
    default:
        break;
    }

    // c is already consumed; look for the longest operator starting with it
    --pos_;
    for (auto op : MULTI_CHAR_OPERATORS) {
        if (source_.slice(pos_, pos_ + op.size()) == op) {
            pos_ += op.size();
            return make_token(TokenKind::Operator);
        }
    }
    ++pos_;

    return make_token(TokenKind::Operator);
}

} // namespace domainfix::lexer
