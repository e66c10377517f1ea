#include "rules/file_context.hpp"

namespace domainfix::rules {

auto find_next_token(std::span<const lexer::Token> tokens, lexer::TokenKind kind,
                     TokenIndex from) -> std::optional<TokenIndex> {
    for (TokenIndex i = from; i < tokens.size(); ++i) {
        if (tokens[i].kind == kind) {
            return i;
        }
    }
    return std::nullopt;
}

auto FileContext::find_next(lexer::TokenKind kind, TokenIndex from) const
    -> std::optional<TokenIndex> {
    return find_next_token(tokens(), kind, from);
}

} // namespace domainfix::rules
