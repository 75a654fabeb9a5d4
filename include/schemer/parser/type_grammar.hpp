#pragma once

#include "schemer/parser/diagnostics.hpp"
#include "schemer/parser/token_cursor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemer::parser {

enum class TypeKind : std::uint8_t {
    Simple = 0,
    Array,
    Struct,
    Map
};

/// Recursive column type. `children` holds the element of an Array, the key
/// and value of a Map, or the fields of a Struct (named by `field_names`).
/// `dimensions` records postfix array suffixes: `INT[]`, `INT ARRAY[3]`.
struct TypeNode final {
    TypeKind kind = TypeKind::Simple;
    std::string name{};
    std::vector<std::string> arguments{};
    std::vector<std::string> field_names{};
    std::vector<TypeNode> children{};
    std::vector<std::optional<std::int64_t>> dimensions{};

    friend bool operator==(const TypeNode&, const TypeNode&) = default;
};

/// Recursive descent over a type-token span. Parsing stops before the first
/// token that cannot continue the type (a column attribute, a comma, the end
/// of the span) so the caller's clause dispatch can take over.
class TypeParser final {
public:
    explicit TypeParser(TokenCursor& cursor) noexcept : cursor_{cursor} {}

    TypeNode parse();

private:
    TypeNode parse_nested(std::size_t depth);
    TypeNode parse_simple();
    void parse_arguments(TypeNode& node);
    void parse_modifiers(TypeNode& node);
    void parse_dimensions(TypeNode& node);
    void expect_close_angle();

    TokenCursor& cursor_;
};

[[nodiscard]] std::string canonical_type_string(const TypeNode& node);

/// Canonical form without the top-level argument list, used for the column
/// `type` field once the arguments have been moved into `size`.
[[nodiscard]] std::string canonical_type_name(const TypeNode& node);

[[nodiscard]] ParseResult<TypeNode> parse_type(std::string_view input);

}  // namespace schemer::parser
