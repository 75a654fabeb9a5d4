#include "schemer/output/json_writer.hpp"

#include <string>

namespace schemer::output {

namespace {

void append_newline(std::string& out, int indent, int depth)
{
    if (indent < 0) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent) * static_cast<std::size_t>(depth), ' ');
}

void append_value(std::string& out, const Value& value, int indent, int depth)
{
    switch (value.kind()) {
    case ValueKind::Null:
        out.append("null");
        break;
    case ValueKind::Bool:
        out.append(value.as_bool() ? "true" : "false");
        break;
    case ValueKind::Integer:
        out.append(std::to_string(value.as_integer()));
        break;
    case ValueKind::String:
        append_json_string(out, value.as_string());
        break;
    case ValueKind::Array: {
        const auto& array = value.as_array();
        if (array.empty()) {
            out.append("[]");
            break;
        }
        out.push_back('[');
        for (std::size_t index = 0U; index < array.size(); ++index) {
            if (index > 0U) {
                out.push_back(',');
            }
            append_newline(out, indent, depth + 1);
            append_value(out, array[index], indent, depth + 1);
        }
        append_newline(out, indent, depth);
        out.push_back(']');
        break;
    }
    case ValueKind::Object: {
        const auto& object = value.as_object();
        if (object.empty()) {
            out.append("{}");
            break;
        }
        out.push_back('{');
        bool first = true;
        for (const auto& [name, member] : object) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            append_newline(out, indent, depth + 1);
            append_json_string(out, name);
            out.push_back(':');
            if (indent >= 0) {
                out.push_back(' ');
            }
            append_value(out, member, indent, depth + 1);
        }
        append_newline(out, indent, depth);
        out.push_back('}');
        break;
    }
    }
}

}  // namespace

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789abcdef";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

std::string write_json(const Value& value, int indent)
{
    std::string json;
    json.reserve(256U);
    append_value(json, value, indent, 0);
    return json;
}

}  // namespace schemer::output
