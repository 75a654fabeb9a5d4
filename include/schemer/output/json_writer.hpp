#pragma once

#include "schemer/output/value.hpp"

#include <string>
#include <string_view>

namespace schemer::output {

/// Appends `text` as a quoted JSON string. Control characters are escaped;
/// bytes >= 0x80 are copied through so UTF-8 input stays UTF-8.
void append_json_string(std::string& out, std::string_view text);

/// Serialises `value`. A negative indent produces compact single-line JSON;
/// otherwise nested members are placed on their own lines indented by
/// `indent` spaces per level. Object members keep insertion order.
[[nodiscard]] std::string write_json(const Value& value, int indent = -1);

}  // namespace schemer::output
