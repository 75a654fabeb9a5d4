#pragma once

#include "schemer/parser/diagnostics.hpp"
#include "schemer/parser/token.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace schemer::parser {

/// Ordered, restartable sequence of tokens produced for one parse call. The
/// stream owns its tokens and is never shared between calls.
class TokenStream final {
public:
    TokenStream() = default;
    explicit TokenStream(std::vector<Token> tokens);

    [[nodiscard]] bool at_end() const noexcept { return cursor_ >= tokens_.size(); }
    [[nodiscard]] const Token* peek(std::size_t lookahead = 0U) const noexcept;
    const Token* next() noexcept;
    void reset() noexcept { cursor_ = 0U; }

    [[nodiscard]] std::size_t position() const noexcept { return cursor_; }
    [[nodiscard]] std::size_t size() const noexcept { return tokens_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tokens_.empty(); }
    [[nodiscard]] std::span<const Token> tokens() const noexcept { return tokens_; }

private:
    std::vector<Token> tokens_{};
    std::size_t cursor_ = 0U;
};

struct TokenizeResult final {
    std::optional<TokenStream> tokens{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return tokens.has_value(); }
};

/// Splits DDL text into tokens, dropping whitespace and the three comment
/// styles. An unterminated string, quoted identifier or block comment fails
/// the whole call with a diagnostic located at the opening delimiter.
[[nodiscard]] TokenizeResult tokenize(std::string_view input);

}  // namespace schemer::parser
