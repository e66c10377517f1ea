//! # Lexer - Token Dispatch
//!
//! This file implements the `next_token()` entry point.
//!
//! ## Token Dispatch Order
//!
//! Outside PHP tags:
//! 1. Return `Eof` at end of input
//! 2. Lex an open tag if one starts here, otherwise inline HTML up to it
//!
//! Inside PHP tags:
//! 1. Skip whitespace and comments
//! 2. Return `Eof` at end of input
//! 3. `?>` close tag
//! 4. Variables, identifiers, numbers
//! 5. Strings (single, double, backtick), heredoc
//! 6. Operators and delimiters

#include "lexer/lexer.hpp"

namespace domainfix::lexer {

auto Lexer::next_token() -> Token {
    if (!in_php_) {
        token_start_ = pos_;
        if (is_at_end()) {
            return make_token(TokenKind::Eof);
        }
        if (at_open_tag()) {
            return lex_open_tag();
        }
        return lex_inline_html();
    }

    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (c == '?' && peek_next() == '>') {
        return lex_close_tag();
    }

    if (c == '$' && is_identifier_start(peek_next())) {
        return lex_variable();
    }

    if (is_identifier_start(c) || (c == '\\' && is_identifier_start(peek_next()))) {
        return lex_identifier();
    }

    if ((c >= '0' && c <= '9') || (c == '.' && peek_next() >= '0' && peek_next() <= '9')) {
        return lex_number();
    }

    if (c == '\'') {
        return lex_single_quoted();
    }

    if (c == '"' || c == '`') {
        return lex_double_quoted();
    }

    if (c == '<' && peek_next() == '<' && peek_n(2) == '<') {
        return lex_heredoc();
    }

    return lex_operator();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        Token token = next_token();
        bool done = token.is_eof();
        tokens.push_back(token);
        if (done) {
            break;
        }
    }
    return tokens;
}

} // namespace domainfix::lexer
