#include "schemer/parser/token.hpp"

namespace schemer::parser {

std::string_view token_kind_name(TokenKind kind) noexcept
{
    switch (kind) {
    case TokenKind::Keyword:
        return "keyword";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::QuotedIdentifier:
        return "quoted-identifier";
    case TokenKind::StringLiteral:
        return "string-literal";
    case TokenKind::NumberLiteral:
        return "number-literal";
    case TokenKind::Punctuation:
        return "punctuation";
    case TokenKind::Operator:
    default:
        return "operator";
    }
}

}  // namespace schemer::parser
