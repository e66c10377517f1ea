//! # Text Domain Rule
//!
//! ## Argument Splitting
//!
//! The argument list is walked token by token with a parenthesis depth that
//! starts at 1 after the call's `(`:
//!
//! ```text
//! __( foo( 'x', 'y' ), 'mydomain' )
//!    ^    ^        ^  ^           ^
//!    1    2        1  boundary    0
//! ```
//!
//! Commas only separate arguments at depth 1; at depth 0 the call is over.
//! Each finished argument is reduced to the position of its first string
//! literal, which is all the rule needs to know about it.

#include "rules/text_domain.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <utility>

namespace domainfix::rules {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto first_string_literal(std::span<const Token> tokens, TokenIndex start, TokenIndex end)
    -> std::optional<TokenIndex> {
    for (TokenIndex i = start; i < end; ++i) {
        if (tokens[i].kind == TokenKind::StringLiteral) {
            return i;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Pipeline Stages
// ============================================================================

auto is_translation_function(std::string_view name) -> bool {
    return std::find(TRANSLATION_FUNCTIONS.begin(), TRANSLATION_FUNCTIONS.end(), name) !=
           TRANSLATION_FUNCTIONS.end();
}

auto split_arguments(std::span<const Token> tokens, TokenIndex open_paren)
    -> std::vector<TokenIndex> {
    std::vector<TokenIndex> arguments;
    int depth = 1;
    TokenIndex arg_start = open_paren + 1;

    auto finish_argument = [&](TokenIndex end) {
        if (auto literal = first_string_literal(tokens, arg_start, end)) {
            arguments.push_back(*literal);
        }
    };

    for (TokenIndex i = open_paren + 1; i < tokens.size(); ++i) {
        switch (tokens[i].kind) {
        case TokenKind::LParen:
            ++depth;
            break;
        case TokenKind::RParen:
            --depth;
            if (depth == 0) {
                finish_argument(i);
                return arguments;
            }
            break;
        case TokenKind::Comma:
            if (depth == 1) {
                finish_argument(i);
                arg_start = i + 1;
            }
            break;
        default:
            break;
        }
    }

    // Unbalanced: the stream ended inside the call
    return arguments;
}

auto last_argument(const std::vector<TokenIndex>& arguments) -> std::optional<TokenIndex> {
    if (arguments.empty()) {
        return std::nullopt;
    }
    return arguments.back();
}

auto strip_quotes(std::string_view literal) -> std::string_view {
    auto is_quote = [](char c) { return c == '\'' || c == '"'; };

    if (!literal.empty() && is_quote(literal.front())) {
        literal.remove_prefix(1);
    }
    if (!literal.empty() && is_quote(literal.back())) {
        literal.remove_suffix(1);
    }
    return literal;
}

// ============================================================================
// TextDomainRule
// ============================================================================

TextDomainRule::TextDomainRule(TextDomainConfig config) : config_(std::move(config)) {}

auto TextDomainRule::message(std::string_view function) const -> std::string {
    std::string text = "Text domain \"";
    text += config_.original_domain;
    text += "\" in function ";
    text += function;
    text += "() should be replaced with \"";
    text += config_.target_domain;
    text += "\".";
    return text;
}

auto TextDomainRule::check_call(std::span<const Token> tokens, TokenIndex name_pos,
                                TokenIndex open_paren) const -> std::optional<Finding> {
    auto domain_pos = last_argument(split_arguments(tokens, open_paren));
    if (!domain_pos) {
        return std::nullopt;
    }

    auto domain = strip_quotes(tokens[*domain_pos].lexeme);
    if (domain != config_.original_domain) {
        return std::nullopt;
    }

    return Finding{.position = *domain_pos,
                   .function = std::string(tokens[name_pos].lexeme),
                   .replacement = "'" + config_.target_domain + "'"};
}

template <typename FindParen>
auto TextDomainRule::collect(std::span<const Token> tokens, FindParen find_paren) const
    -> std::vector<Finding> {
    std::vector<Finding> findings;
    if (!config_.is_active()) {
        return findings;
    }

    for (TokenIndex i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::Identifier || !is_translation_function(tokens[i].lexeme)) {
            continue;
        }

        std::optional<TokenIndex> open_paren = find_paren(i + 1);
        if (!open_paren) {
            continue;
        }

        if (auto finding = check_call(tokens, i, *open_paren)) {
            DOMAINFIX_LOG_TRACE("rules", "Domain literal at token " << finding->position
                                                                    << " in " << finding->function
                                                                    << "() matches");
            findings.push_back(std::move(*finding));
        }
    }

    return findings;
}

auto TextDomainRule::scan(std::span<const Token> tokens) const -> std::vector<Finding> {
    return collect(tokens, [tokens](TokenIndex from) {
        return find_next_token(tokens, TokenKind::LParen, from);
    });
}

void TextDomainRule::process(FileContext& file) const {
    if (!config_.is_active()) {
        return;
    }

    auto findings = collect(file.tokens(), [&file](TokenIndex from) {
        return file.find_next(TokenKind::LParen, from);
    });

    for (const auto& finding : findings) {
        if (file.add_fixable_error(finding.position, message(finding.function),
                                   REPLACE_DOMAIN_CODE)) {
            file.replace_token(finding.position, finding.replacement);
        }
    }
}

} // namespace domainfix::rules
