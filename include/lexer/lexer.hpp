//! # PHP Lexer
//!
//! Converts PHP source text into the flat token stream the lint rules scan.
//!
//! ## Features
//!
//! - **Inline HTML**: Text outside `<?php ... ?>` becomes `InlineHtml` tokens
//! - **Comments**: `//`, `#` and `/* */` are skipped like whitespace
//! - **Strings**: Single-quoted, double-quoted (with interpolation detection),
//!   heredoc and nowdoc
//! - **Names**: Identifiers, `\`-qualified names and `$variables`
//!
//! ## Error Recovery
//!
//! The lexer continues after errors, producing `TokenKind::Error` tokens.
//! All errors are collected and can be retrieved via `errors()`.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("<?php _e( 'Hi', 'my-domain' );");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! ```

#ifndef DOMAINFIX_LEXER_LEXER_HPP
#define DOMAINFIX_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace domainfix::lexer {

/// An error encountered during lexical analysis.
struct LexerError {
    std::string message; ///< Human-readable error description.
    SourceSpan span;     ///< Location of the error in source.
    std::string code;    ///< Error code (e.g., "L001").
};

/// Lexical analyzer for PHP source code.
///
/// The lexer starts in HTML mode and switches to PHP mode at an open tag.
/// It produces tokens incrementally via `next_token()` or all at once via
/// `tokenize()`.
class Lexer {
public:
    /// Constructs a lexer for the given source. The source must outlive the lexer
    /// and every token it produces.
    explicit Lexer(const Source& source);

    /// Returns the next token, `TokenKind::Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source. The returned vector ends with `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    bool in_php_ = false; ///< False while scanning inline HTML.
    std::vector<LexerError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    /// Returns true if the text at the current position starts with `text`,
    /// compared ASCII case-insensitively.
    [[nodiscard]] auto matches_ahead(std::string_view text) const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message, const std::string& code)
        -> Token;
    void report_error(const std::string& message, const std::string& code);

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    void skip_whitespace();
    void skip_line_comment();
    void skip_block_comment();

    // ========================================================================
    // Markup
    // ========================================================================

    [[nodiscard]] auto at_open_tag() const -> bool;
    [[nodiscard]] auto lex_open_tag() -> Token;
    [[nodiscard]] auto lex_close_tag() -> Token;
    [[nodiscard]] auto lex_inline_html() -> Token;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_variable() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_single_quoted() -> Token;

    /// Lexes `"..."` or a backtick shell string; the quote is the current char.
    [[nodiscard]] auto lex_double_quoted() -> Token;

    /// Lexes a heredoc or nowdoc. Falls back to `lex_operator()` when `<<<`
    /// is not followed by a valid label.
    [[nodiscard]] auto lex_heredoc() -> Token;

    [[nodiscard]] auto lex_operator() -> Token;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
};

} // namespace domainfix::lexer

#endif // DOMAINFIX_LEXER_LEXER_HPP
