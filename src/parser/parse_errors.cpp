#include "schemer/parser/parse_errors.hpp"

#include <string>

namespace schemer::parser {

namespace {

class ParseErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "schemer.parser";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ParseErrc>(condition)) {
        case ParseErrc::Success:
            return "success";
        case ParseErrc::UnterminatedString:
            return "unterminated string literal";
        case ParseErrc::UnterminatedIdentifier:
            return "unterminated quoted identifier";
        case ParseErrc::UnterminatedComment:
            return "unterminated block comment";
        case ParseErrc::UnexpectedCharacter:
            return "unexpected character";
        case ParseErrc::UnknownStatement:
            return "unknown statement kind";
        case ParseErrc::MissingColumnList:
            return "missing column list";
        case ParseErrc::UnexpectedToken:
            return "unexpected token";
        case ParseErrc::UnexpectedEnd:
            return "unexpected end of statement";
        case ParseErrc::UnknownClause:
            return "unknown clause";
        case ParseErrc::UnresolvedAlterTarget:
            return "alter target table not found";
        case ParseErrc::UnresolvedIndexTarget:
            return "index target table not found";
        case ParseErrc::DuplicateColumn:
            return "duplicate column";
        case ParseErrc::UnknownKeyColumn:
            return "key references undeclared column";
        case ParseErrc::InvalidNumber:
            return "invalid numeric literal";
        default:
            return "unknown parser error";
        }
    }
};

const ParseErrorCategory kCategory{};

}  // namespace

const std::error_category& parse_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(ParseErrc value) noexcept
{
    return {static_cast<int>(value), parse_error_category()};
}

}  // namespace schemer::parser
