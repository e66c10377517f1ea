//! # Lexer Core
//!
//! This file implements core lexer functionality:
//!
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Comment handling**: `//` and `#` line comments, `/* */` block comments
//! - **Markup**: PHP open/close tags and inline HTML
//!
//! ## Comments and Close Tags
//!
//! As in PHP, a line comment ends at the newline or right before `?>`,
//! whichever comes first. Block comments do not nest.

#include "lexer/lexer.hpp"

#include <cctype>

namespace domainfix::lexer {

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::matches_ahead(std::string_view text) const -> bool {
    if (pos_ + text.size() > source_.length()) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        auto a = static_cast<unsigned char>(source_.at(pos_ + i));
        auto b = static_cast<unsigned char>(text[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

auto Lexer::make_token(TokenKind kind) -> Token {
    auto start_loc = source_.location(token_start_);
    start_loc.length = static_cast<uint32_t>(pos_ - token_start_);
    auto end_loc = source_.location(pos_ > token_start_ ? pos_ - 1 : token_start_);

    return Token{.kind = kind,
                 .span = {start_loc, end_loc},
                 .lexeme = source_.slice(token_start_, pos_)};
}

auto Lexer::make_error_token(const std::string& message, const std::string& code) -> Token {
    report_error(message, code);
    return make_token(TokenKind::Error);
}

void Lexer::report_error(const std::string& message, const std::string& code) {
    auto start_loc = source_.location(token_start_);
    auto end_loc = source_.location(pos_);

    errors_.push_back(LexerError{.message = message, .span = {start_loc, end_loc}, .code = code});
}

// ============================================================================
// Whitespace and Comments
// ============================================================================

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        switch (c) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
        case '\f':
        case '\v':
            advance();
            break;
        case '#':
            // PHP 8 attributes: #[...]
            if (peek_next() == '[') {
                return;
            }
            skip_line_comment();
            break;
        case '/':
            if (peek_next() == '/') {
                skip_line_comment();
            } else if (peek_next() == '*') {
                skip_block_comment();
            } else {
                return;
            }
            break;
        default:
            return;
        }
    }
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        if (peek() == '?' && peek_next() == '>') {
            return;
        }
        advance();
    }
}

void Lexer::skip_block_comment() {
    token_start_ = pos_;
    advance(); // /
    advance(); // *

    while (!is_at_end()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            return;
        }
        advance();
    }

    report_error("Unterminated block comment", "L002");
}

// ============================================================================
// Markup
// ============================================================================

auto Lexer::at_open_tag() const -> bool {
    if (matches_ahead("<?=")) {
        return true;
    }
    if (!matches_ahead("<?php")) {
        return false;
    }
    char after = peek_n(5);
    return after == '\0' || after == ' ' || after == '\t' || after == '\n' || after == '\r';
}

auto Lexer::lex_open_tag() -> Token {
    token_start_ = pos_;
    pos_ += matches_ahead("<?=") ? 3 : 5;
    in_php_ = true;
    return make_token(TokenKind::OpenTag);
}

auto Lexer::lex_close_tag() -> Token {
    advance(); // ?
    advance(); // >

    // A single newline directly after ?> belongs to the tag
    if (peek() == '\n') {
        advance();
    } else if (peek() == '\r' && peek_next() == '\n') {
        advance();
        advance();
    }

    in_php_ = false;
    return make_token(TokenKind::CloseTag);
}

auto Lexer::lex_inline_html() -> Token {
    token_start_ = pos_;
    while (!is_at_end() && !at_open_tag()) {
        advance();
    }
    return make_token(TokenKind::InlineHtml);
}

} // namespace domainfix::lexer
