//! # Text Domain Rule
//!
//! Finds WordPress translation calls whose text domain is a given string
//! literal and proposes replacing it with another domain.
//!
//! ```php
//! __( 'Hello', 'old-domain' );      // flagged
//! __( 'Hello', 'new-domain' );      // after the fix
//! _n( 'One', 'Many', $n, $domain ); // never flagged: not a literal
//! ```
//!
//! ## Pipeline
//!
//! | Stage          | Function                    |
//! |----------------|-----------------------------|
//! | Call sites     | `is_translation_function()` |
//! | Arguments      | `split_arguments()`         |
//! | Text domain    | `last_argument()`           |
//! | Match and emit | `TextDomainRule::scan()`    |
//!
//! Every stage only reads the token stream. The rule holds nothing but its
//! immutable configuration, so one instance can be shared by any number of
//! files and threads.

#ifndef DOMAINFIX_RULES_TEXT_DOMAIN_HPP
#define DOMAINFIX_RULES_TEXT_DOMAIN_HPP

#include "lexer/token.hpp"
#include "rules/file_context.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace domainfix::rules {

/// Name of the rule, used as the prefix of reported codes.
constexpr std::string_view TEXT_DOMAIN_RULE = "TextDomain";

/// Code of the "replace this domain" issue.
constexpr std::string_view REPLACE_DOMAIN_CODE = "ReplaceDomain";

/// Translation functions that take the text domain as their last argument.
constexpr std::array<std::string_view, 11> TRANSLATION_FUNCTIONS = {
    "__",         "_e",         "_x",         "_n",         "_nx",        "esc_html__",
    "esc_html_e", "esc_html_x", "esc_attr__", "esc_attr_e", "esc_attr_x",
};

/// Source and target domains. An empty target disables the rule.
struct TextDomainConfig {
    std::string original_domain;
    std::string target_domain;

    [[nodiscard]] auto is_active() const -> bool {
        return !target_domain.empty();
    }
};

/// A text domain literal that should be replaced.
struct Finding {
    TokenIndex position;     ///< The string literal token.
    std::string function;    ///< Name of the enclosing translation call.
    std::string replacement; ///< New full text for the literal token.
};

/// True if `name` is exactly (case-sensitively) one of TRANSLATION_FUNCTIONS.
[[nodiscard]] auto is_translation_function(std::string_view name) -> bool;

/// Splits the argument list of the call whose `(` is at `open_paren`.
///
/// Returns, in argument order, the index of the first string literal of each
/// top-level argument. Arguments without a literal contribute nothing, so
/// the result may be shorter than the argument count. Nested parentheses
/// are skipped by depth tracking. If the stream ends before the call's `)`,
/// the unfinished last argument is dropped.
[[nodiscard]] auto split_arguments(std::span<const lexer::Token> tokens, TokenIndex open_paren)
    -> std::vector<TokenIndex>;

/// The text domain candidate: the last entry of `split_arguments()`.
[[nodiscard]] auto last_argument(const std::vector<TokenIndex>& arguments)
    -> std::optional<TokenIndex>;

/// Removes one leading and one trailing quote (`'` or `"`, independently).
[[nodiscard]] auto strip_quotes(std::string_view literal) -> std::string_view;

/// The text domain rule.
class TextDomainRule {
public:
    explicit TextDomainRule(TextDomainConfig config);

    [[nodiscard]] auto config() const -> const TextDomainConfig& {
        return config_;
    }

    /// Returns all findings for one token stream, in file order.
    [[nodiscard]] auto scan(std::span<const lexer::Token> tokens) const -> std::vector<Finding>;

    /// Reports every finding to `file` and applies the fixes it accepts.
    void process(FileContext& file) const;

    /// The issue message for a finding in `function`.
    [[nodiscard]] auto message(std::string_view function) const -> std::string;

private:
    const TextDomainConfig config_;

    /// Walks all call sites; `find_paren(from)` locates the `(` after a name.
    template <typename FindParen>
    [[nodiscard]] auto collect(std::span<const lexer::Token> tokens, FindParen find_paren) const
        -> std::vector<Finding>;

    [[nodiscard]] auto check_call(std::span<const lexer::Token> tokens, TokenIndex name_pos,
                                  TokenIndex open_paren) const -> std::optional<Finding>;
};

} // namespace domainfix::rules

#endif // DOMAINFIX_RULES_TEXT_DOMAIN_HPP
