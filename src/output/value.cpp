#include "schemer/output/value.hpp"

#include <stdexcept>

namespace schemer::output {

namespace {

[[noreturn]] void throw_kind_mismatch(const char* expected)
{
    throw std::logic_error{std::string{"output value is not "} + expected};
}

}  // namespace

bool Value::as_bool() const
{
    if (const auto* value = std::get_if<bool>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch("a boolean");
}

std::int64_t Value::as_integer() const
{
    if (const auto* value = std::get_if<std::int64_t>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch("an integer");
}

const std::string& Value::as_string() const
{
    if (const auto* value = std::get_if<std::string>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch("a string");
}

const Array& Value::as_array() const
{
    if (const auto* value = std::get_if<Array>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch("an array");
}

const Object& Value::as_object() const
{
    if (const auto* value = std::get_if<Object>(&storage_)) {
        return *value;
    }
    throw_kind_mismatch("an object");
}

const Value* Value::find(std::string_view key) const noexcept
{
    const auto* object = std::get_if<Object>(&storage_);
    if (object == nullptr) {
        return nullptr;
    }
    for (const auto& [name, value] : *object) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

const Value& Value::at(std::string_view key) const
{
    if (const auto* value = find(key)) {
        return *value;
    }
    throw std::out_of_range{"output object has no member '" + std::string{key} + "'"};
}

const Value& Value::at(std::size_t index) const
{
    const auto& array = as_array();
    if (index >= array.size()) {
        throw std::out_of_range{"output array index " + std::to_string(index) + " is out of range"};
    }
    return array[index];
}

std::size_t Value::size() const noexcept
{
    if (const auto* array = std::get_if<Array>(&storage_)) {
        return array->size();
    }
    if (const auto* object = std::get_if<Object>(&storage_)) {
        return object->size();
    }
    return 0U;
}

std::vector<std::string> Value::keys() const
{
    std::vector<std::string> names{};
    if (const auto* object = std::get_if<Object>(&storage_)) {
        names.reserve(object->size());
        for (const auto& [name, _] : *object) {
            names.push_back(name);
        }
    }
    return names;
}

Value& Value::set(std::string key, Value value)
{
    if (is_null()) {
        storage_ = Object{};
    }
    auto* object = std::get_if<Object>(&storage_);
    if (object == nullptr) {
        throw_kind_mismatch("an object");
    }
    for (auto& [name, existing] : *object) {
        if (name == key) {
            existing = std::move(value);
            return existing;
        }
    }
    object->emplace_back(std::move(key), std::move(value));
    return object->back().second;
}

void Value::push_back(Value value)
{
    if (is_null()) {
        storage_ = Array{};
    }
    auto* array = std::get_if<Array>(&storage_);
    if (array == nullptr) {
        throw_kind_mismatch("an array");
    }
    array->push_back(std::move(value));
}

}  // namespace schemer::output
