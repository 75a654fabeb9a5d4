#pragma once

#include <cstdint>
#include <string_view>

namespace schemer::parser {

enum class KeywordCategory : std::uint8_t {
    None = 0,
    ReservedWord,
    TypeName,
    DialectClauseWord
};

/// Structural roles a word can play; the reducer consults these to find clause
/// boundaries, so a new dialect word becomes a boundary by being listed here.
enum class KeywordRole : std::uint8_t {
    None = 0,
    ColumnAttribute = 1U << 0U,
    TableClause = 1U << 1U,
    TypeModifier = 1U << 2U,
    SequenceOption = 1U << 3U
};

struct KeywordInfo final {
    KeywordCategory category = KeywordCategory::None;
    std::uint8_t roles = 0U;

    [[nodiscard]] bool has_role(KeywordRole role) const noexcept
    {
        return (roles & static_cast<std::uint8_t>(role)) != 0U;
    }
};

/// Looks up an upper-cased word. Unknown words yield a `None` category with no
/// roles. The table is immutable and safe to consult from any thread.
[[nodiscard]] KeywordInfo lookup_keyword(std::string_view normalized) noexcept;

[[nodiscard]] KeywordCategory classify_keyword(std::string_view normalized) noexcept;

[[nodiscard]] bool has_keyword_role(std::string_view normalized, KeywordRole role) noexcept;

[[nodiscard]] std::string_view keyword_category_name(KeywordCategory category) noexcept;

}  // namespace schemer::parser
