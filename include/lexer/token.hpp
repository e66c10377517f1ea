//! # Token Definitions
//!
//! Token kinds produced by the PHP tokenizer.
//!
//! ## Overview
//!
//! The categories follow the ones PHP's own tokenizer uses, reduced to what a
//! token-level lint rule needs:
//!
//! - **Markup**: `InlineHtml` outside PHP tags, `OpenTag`, `CloseTag`
//! - **Names**: `Identifier` (functions, constants, classes), `Variable` (`$x`)
//! - **Literals**: `StringLiteral`, `InterpolatedString`, `Heredoc`, `Number`
//! - **Delimiters**: `LParen`, `RParen`, `Comma`
//! - **Other**: `Operator` for all remaining punctuation
//! - **Special**: `Eof`, `Error`
//!
//! ## String Literals
//!
//! Only strings whose value is fully known at lex time are `StringLiteral`:
//! single-quoted strings and double-quoted strings without `$` interpolation.
//! `"Hello $name"` is an `InterpolatedString`.

#ifndef DOMAINFIX_LEXER_TOKEN_HPP
#define DOMAINFIX_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace domainfix::lexer {

/// All token kinds produced by the lexer.
enum class TokenKind : uint8_t {
    Eof, ///< End of input stream

    // ========================================================================
    // Markup
    // ========================================================================
    InlineHtml, ///< Text outside `<?php ... ?>`
    OpenTag,    ///< `<?php` or `<?=`
    CloseTag,   ///< `?>`

    // ========================================================================
    // Names
    // ========================================================================
    Identifier, ///< `esc_html__`, `Foo\bar`, `true`
    Variable,   ///< `$domain`

    // ========================================================================
    // Literals
    // ========================================================================
    StringLiteral,      ///< `'text'`, `"text"` (no interpolation)
    InterpolatedString, ///< `"Hello $name"`
    Heredoc,            ///< `<<<EOT ... EOT`, `<<<'EOT' ... EOT`
    Number,             ///< `42`, `0x1F`, `1.5e3`

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen, ///< `(`
    RParen, ///< `)`
    Comma,  ///< `,`

    // ========================================================================
    // Other
    // ========================================================================
    Operator, ///< Any other punctuation: `;`, `->`, `=>`, `.`, `[`, ...
    Error,    ///< Malformed input (unterminated string or comment)
};

/// Returns a display name for a token kind.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// A lexical token.
///
/// The lexeme is a view into the `Source` the token was lexed from and
/// includes quote characters for string literals.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Byte offset of the first character of the token.
    [[nodiscard]] auto offset() const -> size_t {
        return span.start.offset;
    }
};

} // namespace domainfix::lexer

#endif // DOMAINFIX_LEXER_TOKEN_HPP
