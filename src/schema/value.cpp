#include "schema/value.h"

#include <array>
#include <charconv>
#include <utility>

namespace nvlink::schema {
namespace {

std::string FormatReal(double value) {
    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc()) {
        return "nan";
    }
    return std::string(buffer.data(), ptr);
}

std::string QuoteString(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('"');
    for (const char ch : text) {
        if (ch == '"' || ch == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

void AppendValue(const Value& value, std::string& out_text) {
    switch (value.kind) {
        case ValueKind::Bool:
            out_text += value.bool_value ? "TRUE" : "FALSE";
            return;
        case ValueKind::Int:
            out_text += std::to_string(value.int_value);
            return;
        case ValueKind::UInt:
            out_text += std::to_string(value.uint_value);
            return;
        case ValueKind::Real:
            out_text += FormatReal(value.real_value);
            return;
        case ValueKind::String:
            out_text += QuoteString(value.string_value);
            return;
        case ValueKind::Array:
            out_text.push_back('[');
            for (std::size_t index = 0; index < value.items.size(); ++index) {
                if (index > 0) {
                    out_text += ", ";
                }
                AppendValue(value.items[index], out_text);
            }
            out_text.push_back(']');
            return;
        case ValueKind::Struct:
            out_text.push_back('{');
            for (std::size_t index = 0; index < value.items.size(); ++index) {
                if (index > 0) {
                    out_text += ", ";
                }
                out_text += index < value.member_names.size() ? value.member_names[index] : "?";
                out_text.push_back('=');
                AppendValue(value.items[index], out_text);
            }
            out_text.push_back('}');
            return;
    }
}

}  // namespace

const char* ValueKindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Int:
            return "int";
        case ValueKind::UInt:
            return "uint";
        case ValueKind::Real:
            return "real";
        case ValueKind::String:
            return "string";
        case ValueKind::Array:
            return "array";
        case ValueKind::Struct:
            return "struct";
    }

    return "unknown";
}

void Value::AddMember(std::string name, Value value) {
    member_names.push_back(std::move(name));
    items.push_back(std::move(value));
}

const Value* Value::FindMember(std::string_view name) const {
    for (std::size_t index = 0; index < member_names.size() && index < items.size(); ++index) {
        if (member_names[index] == name) {
            return &items[index];
        }
    }
    return nullptr;
}

bool Value::operator==(const Value& other) const {
    if (kind != other.kind) {
        return false;
    }

    switch (kind) {
        case ValueKind::Bool:
            return bool_value == other.bool_value;
        case ValueKind::Int:
            return int_value == other.int_value;
        case ValueKind::UInt:
            return uint_value == other.uint_value;
        case ValueKind::Real:
            return real_value == other.real_value;
        case ValueKind::String:
            return string_value == other.string_value;
        case ValueKind::Array:
            return items == other.items;
        case ValueKind::Struct:
            return member_names == other.member_names && items == other.items;
    }

    return false;
}

bool Value::operator!=(const Value& other) const {
    return !(*this == other);
}

Value BoolValue(bool value) {
    Value result;
    result.kind = ValueKind::Bool;
    result.bool_value = value;
    return result;
}

Value IntValue(std::int64_t value) {
    Value result;
    result.kind = ValueKind::Int;
    result.int_value = value;
    return result;
}

Value UIntValue(std::uint64_t value) {
    Value result;
    result.kind = ValueKind::UInt;
    result.uint_value = value;
    return result;
}

Value RealValue(double value) {
    Value result;
    result.kind = ValueKind::Real;
    result.real_value = value;
    return result;
}

Value StringValue(std::string value) {
    Value result;
    result.kind = ValueKind::String;
    result.string_value = std::move(value);
    return result;
}

Value ArrayValue(std::vector<Value> items) {
    Value result;
    result.kind = ValueKind::Array;
    result.items = std::move(items);
    return result;
}

Value StructValue() {
    Value result;
    result.kind = ValueKind::Struct;
    return result;
}

std::string FormatValue(const Value& value) {
    std::string text;
    AppendValue(value, text);
    return text;
}

}  // namespace nvlink::schema
