//! # Rule Host Interface
//!
//! The view of one source file that lint rules work against. Rules only see
//! the token stream and report through this interface; the linter driver
//! implements it (see `linter::LintFile`) and decides what happens with a
//! reported issue and its fix.
//!
//! ## Protocol
//!
//! ```text
//! rule.process(file)
//!   ├─ file.tokens() / file.find_next()      - read the stream
//!   └─ file.add_fixable_error(pos, msg, code)
//!         └─ true → file.replace_token(pos, text)
//! ```

#ifndef DOMAINFIX_RULES_FILE_CONTEXT_HPP
#define DOMAINFIX_RULES_FILE_CONTEXT_HPP

#include "lexer/token.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace domainfix::rules {

/// Position of a token in a file's token stream.
using TokenIndex = size_t;

/// Index of the first token of `kind` at or after `from` in `tokens`.
[[nodiscard]] auto find_next_token(std::span<const lexer::Token> tokens, lexer::TokenKind kind,
                                   TokenIndex from) -> std::optional<TokenIndex>;

/// Host-side access to the token stream of the file being linted.
class FileContext {
public:
    virtual ~FileContext() = default;

    /// The file's tokens in source order.
    [[nodiscard]] virtual auto tokens() const -> std::span<const lexer::Token> = 0;

    /// Reports an issue at `pos`. Returns true if the host wants the fix, in
    /// which case the rule follows up with `replace_token()`.
    virtual auto add_fixable_error(TokenIndex pos, const std::string& message,
                                   std::string_view code) -> bool = 0;

    /// Replaces the full text of the token at `pos`.
    virtual void replace_token(TokenIndex pos, std::string text) = 0;

    /// Index of the first token of `kind` at or after `from`.
    [[nodiscard]] auto find_next(lexer::TokenKind kind, TokenIndex from) const
        -> std::optional<TokenIndex>;
};

} // namespace domainfix::rules

#endif // DOMAINFIX_RULES_FILE_CONTEXT_HPP
