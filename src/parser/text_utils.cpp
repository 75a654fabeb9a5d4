#include "schemer/parser/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace schemer::parser {

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1U)};
}

std::string uppercase_copy(std::string_view text)
{
    std::string upper;
    upper.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(upper), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return upper;
}

std::string lowercase_copy(std::string_view text)
{
    std::string lower;
    lower.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(lower), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lower;
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::toupper(left) != std::toupper(right)) {
            return false;
        }
    }

    return true;
}

}  // namespace schemer::parser
