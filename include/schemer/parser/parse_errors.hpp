#pragma once

#include <system_error>

namespace schemer::parser {

enum class ParseErrc {
    Success = 0,
    UnterminatedString,
    UnterminatedIdentifier,
    UnterminatedComment,
    UnexpectedCharacter,
    UnknownStatement,
    MissingColumnList,
    UnexpectedToken,
    UnexpectedEnd,
    UnknownClause,
    UnresolvedAlterTarget,
    UnresolvedIndexTarget,
    DuplicateColumn,
    UnknownKeyColumn,
    InvalidNumber
};

const std::error_category& parse_error_category() noexcept;
std::error_code make_error_code(ParseErrc value) noexcept;

}  // namespace schemer::parser

namespace std {

template <>
struct is_error_code_enum<schemer::parser::ParseErrc> : true_type {
};

}  // namespace std
