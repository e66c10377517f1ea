#include "lexer/token.hpp"

namespace domainfix::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::InlineHtml:
        return "inline_html";
    case TokenKind::OpenTag:
        return "open_tag";
    case TokenKind::CloseTag:
        return "close_tag";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Variable:
        return "variable";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::InterpolatedString:
        return "interpolated_string";
    case TokenKind::Heredoc:
        return "heredoc";
    case TokenKind::Number:
        return "number";
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Error:
        return "error";
    }
    return "unknown";
}

} // namespace domainfix::lexer
