//! # Lexer - Strings
//!
//! This file implements string literal lexing.
//!
//! ## String Types
//!
//! | Type          | Syntax              | Token kind                            |
//! |---------------|---------------------|---------------------------------------|
//! | Single-quoted | `'text'`            | `StringLiteral`                       |
//! | Double-quoted | `"text"`            | `StringLiteral`                       |
//! | Interpolated  | `"Hi $name"`        | `InterpolatedString`                  |
//! | Shell         | `` `ls` ``          | `InterpolatedString`                  |
//! | Heredoc       | `<<<EOT ... EOT`    | `Heredoc`                             |
//! | Nowdoc        | `<<<'EOT' ... EOT`  | `Heredoc`                             |
//!
//! Escape sequences are skipped, not decoded: the lexeme is the raw source
//! text including its quotes. PHP strings may span lines.
//!
//! ## Interpolation
//!
//! A double-quoted string interpolates when it contains an unescaped `$`
//! followed by a name start or `{`, or an unescaped `{$`.

#include "lexer/lexer.hpp"

namespace domainfix::lexer {

auto Lexer::lex_single_quoted() -> Token {
    advance(); // opening '

    while (!is_at_end()) {
        char c = advance();
        if (c == '\\') {
            if (!is_at_end()) {
                advance();
            }
        } else if (c == '\'') {
            return make_token(TokenKind::StringLiteral);
        }
    }

    return make_error_token("Unterminated string literal", "L001");
}

auto Lexer::lex_double_quoted() -> Token {
    char quote = advance();
    bool interpolated = quote == '`';

    while (!is_at_end()) {
        char c = advance();
        if (c == '\\') {
            if (!is_at_end()) {
                advance();
            }
        } else if (c == quote) {
            return make_token(interpolated ? TokenKind::InterpolatedString
                                           : TokenKind::StringLiteral);
        } else if (c == '$' && (is_identifier_start(peek()) || peek() == '{')) {
            interpolated = true;
        } else if (c == '{' && peek() == '$') {
            interpolated = true;
        }
    }

    return make_error_token("Unterminated string literal", "L001");
}

auto Lexer::lex_heredoc() -> Token {
    size_t saved = pos_;
    pos_ += 3; // <<<

    while (peek() == ' ' || peek() == '\t') {
        advance();
    }

    char label_quote = '\0';
    if (peek() == '\'' || peek() == '"') {
        label_quote = advance();
    }

    size_t label_start = pos_;
    if (!is_identifier_start(peek())) {
        pos_ = saved;
        return lex_operator();
    }
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    std::string_view label = source_.slice(label_start, pos_);

    if (label_quote != '\0') {
        if (peek() != label_quote) {
            pos_ = saved;
            return lex_operator();
        }
        advance();
    }

    if (peek() == '\r') {
        advance();
    }
    if (peek() != '\n') {
        pos_ = saved;
        return lex_operator();
    }

    // Find a line whose first non-blank text is the label, not followed by
    // another name character (PHP 7.3 flexible closing marker).
    while (!is_at_end()) {
        advance(); // \n ending the previous line
        while (peek() == ' ' || peek() == '\t') {
            advance();
        }
        if (source_.slice(pos_, pos_ + label.size()) == label &&
            !is_identifier_continue(peek_n(label.size()))) {
            pos_ += label.size();
            return make_token(TokenKind::Heredoc);
        }
        while (!is_at_end() && peek() != '\n') {
            advance();
        }
    }

    return make_error_token("Unterminated heredoc", "L003");
}

} // namespace domainfix::lexer
