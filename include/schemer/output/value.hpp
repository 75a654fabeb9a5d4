#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace schemer::output {

class Value;

using Array = std::vector<Value>;
/// Insertion-ordered object; key order is part of the output contract.
using Object = std::vector<std::pair<std::string, Value>>;

enum class ValueKind : std::uint8_t {
    Null = 0,
    Bool,
    Integer,
    String,
    Array,
    Object
};

/// JSON-shaped output value produced by the normalizer.
class Value final {
public:
    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool value) noexcept : storage_{value} {}
    Value(int value) noexcept : storage_{static_cast<std::int64_t>(value)} {}
    Value(std::int64_t value) noexcept : storage_{value} {}
    Value(const char* value) : storage_{std::string{value}} {}
    Value(std::string value) noexcept : storage_{std::move(value)} {}
    Value(Array value) noexcept : storage_{std::move(value)} {}
    Value(Object value) noexcept : storage_{std::move(value)} {}

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }
    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }

    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Object& as_object() const;

    /// Object member lookup; nullptr when absent or when this is not an object.
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
    /// Throws std::out_of_range when the member or element is missing.
    [[nodiscard]] const Value& at(std::string_view key) const;
    [[nodiscard]] const Value& at(std::size_t index) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Appends `key`, or replaces it in place when already present.
    Value& set(std::string key, Value value);
    void push_back(Value value);

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.storage_ == rhs.storage_; }

private:
    std::variant<std::nullptr_t, bool, std::int64_t, std::string, Array, Object> storage_{nullptr};
};

}  // namespace schemer::output
