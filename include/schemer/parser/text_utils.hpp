#pragma once

#include <string>
#include <string_view>

namespace schemer::parser {

std::string trim_copy(std::string_view text);
std::string uppercase_copy(std::string_view text);
std::string lowercase_copy(std::string_view text);
bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace schemer::parser
