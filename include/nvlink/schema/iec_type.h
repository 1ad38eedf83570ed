#pragma once

#include "schema/schema.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nvlink::schema {

enum class IecKind : std::uint8_t {
    Bool,
    Sint,
    Usint,
    Byte,
    Int,
    Uint,
    Word,
    Dint,
    Udint,
    Dword,
    Lint,
    Ulint,
    Lword,
    Real,
    Lreal,
    String,
    Array,
    Struct,
};

const char* IecKindName(IecKind kind);

// IEC 61131-3 data type laid out the way CODESYS packs network variable lists:
// little-endian, no padding between struct members, STRING(n) occupies n + 1 bytes.
class IecType final : public ISchema {
public:
    struct Member final {
        std::string name;
        std::shared_ptr<const IecType> type;
    };

    static std::shared_ptr<const IecType> Elementary(IecKind kind);
    static std::shared_ptr<const IecType> String(std::size_t max_length);
    // Array and Struct return nullptr when the byte length does not fit size_t.
    static std::shared_ptr<const IecType> Array(
        std::shared_ptr<const IecType> element_type,
        std::int32_t lower_bound,
        std::size_t element_count);
    static std::shared_ptr<const IecType> Struct(std::vector<Member> members);

    IecKind Kind() const;
    const std::shared_ptr<const IecType>& ElementType() const;
    std::int32_t LowerBound() const;
    std::size_t ElementCount() const;
    const std::vector<Member>& Members() const;

    std::string TypeName() const override;
    std::size_t ByteLength() const override;
    std::vector<ElementLayout> Elements() const override;
    bool ConvertToBuffer(
        const Value& value,
        wire::ByteBuffer& out_buffer,
        std::string& out_error) const override;
    bool ConvertFromBuffer(
        wire::ByteSpan buffer,
        Value& out_value,
        std::string& out_error) const override;

    // Value with every leaf zeroed, matching this type's shape.
    Value DefaultValue() const;

    IecType(IecKind kind, std::size_t byte_length);

private:
    void CollectElements(
        std::size_t base_offset,
        const std::string& path,
        std::vector<ElementLayout>& out_elements) const;
    bool WriteValue(
        const Value& value,
        const std::string& path,
        wire::ByteWriter& writer,
        std::string& out_error) const;
    bool ReadValue(wire::ByteReader& reader, Value& out_value, std::string& out_error) const;

    IecKind kind_;
    std::size_t byte_length_;
    std::shared_ptr<const IecType> element_type_;
    std::int32_t lower_bound_ = 0;
    std::size_t element_count_ = 0;
    std::vector<Member> members_;
};

namespace iec {

std::shared_ptr<const IecType> Bool();
std::shared_ptr<const IecType> Sint();
std::shared_ptr<const IecType> Usint();
std::shared_ptr<const IecType> Byte();
std::shared_ptr<const IecType> Int();
std::shared_ptr<const IecType> Uint();
std::shared_ptr<const IecType> Word();
std::shared_ptr<const IecType> Dint();
std::shared_ptr<const IecType> Udint();
std::shared_ptr<const IecType> Dword();
std::shared_ptr<const IecType> Lint();
std::shared_ptr<const IecType> Ulint();
std::shared_ptr<const IecType> Lword();
std::shared_ptr<const IecType> Real();
std::shared_ptr<const IecType> Lreal();
std::shared_ptr<const IecType> String(std::size_t max_length = 80);

}  // namespace iec

// Declarations such as "INT", "STRING(20)", "ARRAY[0..3] OF REAL" or
// "STRUCT(counter:DINT, temps:ARRAY[1..4] OF REAL, name:STRING(16))".
bool TryParseIecType(
    std::string_view text,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error);

// Parses the FormatValue text form, guided by the target type.
bool TryParseIecValue(
    std::string_view text,
    const IecType& type,
    Value& out_value,
    std::string& out_error);

}  // namespace nvlink::schema
