//! # Lexer - Names and Numbers
//!
//! ## Identifier Rules
//!
//! - Start with a letter, underscore or a byte >= 0x80 (PHP accepts any
//!   non-ASCII byte, which covers UTF-8 names)
//! - Continue with the same plus digits
//! - `\` joins name segments into one qualified name: `\__`, `Foo\bar`
//!
//! Keywords are not distinguished from other names; rules compare lexemes.

#include "lexer/lexer.hpp"

namespace domainfix::lexer {

auto Lexer::is_identifier_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end()) {
        if (is_identifier_continue(peek())) {
            advance();
        } else if (peek() == '\\' && is_identifier_start(peek_next())) {
            advance();
        } else {
            break;
        }
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_variable() -> Token {
    advance(); // $
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Variable);
}

auto Lexer::lex_number() -> Token {
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    // 0x1F, 0b101, 0o17
    if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X' || peek_next() == 'b' ||
                          peek_next() == 'B' || peek_next() == 'o' || peek_next() == 'O')) {
        advance();
        advance();
        while (!is_at_end() && (is_identifier_continue(peek()))) {
            advance();
        }
        return make_token(TokenKind::Number);
    }

    while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
        advance();
    }

    if (peek() == '.' && is_digit(peek_next())) {
        advance();
        while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
            advance();
        }
    } else if (peek() == '.' && pos_ > token_start_) {
        // "1." is a valid float
        advance();
    }

    if (peek() == 'e' || peek() == 'E') {
        char sign = peek_next();
        if (is_digit(sign)) {
            advance();
        } else if ((sign == '+' || sign == '-') && is_digit(peek_n(2))) {
            advance();
            advance();
        }
        while (!is_at_end() && is_digit(peek())) {
            advance();
        }
    }

    return make_token(TokenKind::Number);
}

} // namespace domainfix::lexer
