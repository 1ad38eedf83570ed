#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nvlink::schema {

enum class ValueKind : std::uint8_t {
    Bool = 0,
    Int = 1,
    UInt = 2,
    Real = 3,
    String = 4,
    Array = 5,
    Struct = 6,
};

const char* ValueKindName(ValueKind kind);

// Dynamic value tree exchanged with a schema. Struct members keep declaration order:
// member_names[i] names items[i].
struct Value final {
    ValueKind kind = ValueKind::Bool;
    bool bool_value = false;
    std::int64_t int_value = 0;
    std::uint64_t uint_value = 0;
    double real_value = 0.0;
    std::string string_value;
    std::vector<Value> items;
    std::vector<std::string> member_names;

    void AddMember(std::string name, Value value);
    const Value* FindMember(std::string_view name) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const;
};

Value BoolValue(bool value);
Value IntValue(std::int64_t value);
Value UIntValue(std::uint64_t value);
Value RealValue(double value);
Value StringValue(std::string value);
Value ArrayValue(std::vector<Value> items);
Value StructValue();

// Text form: TRUE/FALSE, integers, reals, "quoted", [a, b], {name=value, ...}.
std::string FormatValue(const Value& value);

}  // namespace nvlink::schema
