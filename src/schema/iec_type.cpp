#include "schema/iec_type.h"

#include <cstring>
#include <limits>
#include <utility>

namespace nvlink::schema {
namespace {

enum class ScalarClass : std::uint8_t {
    Boolean,
    Signed,
    Unsigned,
    Floating,
    Composite,
};

ScalarClass ClassOf(IecKind kind) {
    switch (kind) {
        case IecKind::Bool:
            return ScalarClass::Boolean;
        case IecKind::Sint:
        case IecKind::Int:
        case IecKind::Dint:
        case IecKind::Lint:
            return ScalarClass::Signed;
        case IecKind::Usint:
        case IecKind::Byte:
        case IecKind::Uint:
        case IecKind::Word:
        case IecKind::Udint:
        case IecKind::Dword:
        case IecKind::Ulint:
        case IecKind::Lword:
            return ScalarClass::Unsigned;
        case IecKind::Real:
        case IecKind::Lreal:
            return ScalarClass::Floating;
        case IecKind::String:
        case IecKind::Array:
        case IecKind::Struct:
            return ScalarClass::Composite;
    }

    return ScalarClass::Composite;
}

std::size_t ElementarySize(IecKind kind) {
    switch (kind) {
        case IecKind::Bool:
        case IecKind::Sint:
        case IecKind::Usint:
        case IecKind::Byte:
            return 1;
        case IecKind::Int:
        case IecKind::Uint:
        case IecKind::Word:
            return 2;
        case IecKind::Dint:
        case IecKind::Udint:
        case IecKind::Dword:
        case IecKind::Real:
            return 4;
        case IecKind::Lint:
        case IecKind::Ulint:
        case IecKind::Lword:
        case IecKind::Lreal:
            return 8;
        case IecKind::String:
        case IecKind::Array:
        case IecKind::Struct:
            return 0;
    }

    return 0;
}

std::string DisplayPath(const std::string& path) {
    return path.empty() ? std::string("value") : path;
}

void WriteSized(wire::ByteWriter& writer, std::uint64_t bits, std::size_t byte_length) {
    switch (byte_length) {
        case 1:
            writer.WriteU8(static_cast<wire::Byte>(bits));
            return;
        case 2:
            writer.WriteU16Le(static_cast<std::uint16_t>(bits));
            return;
        case 4:
            writer.WriteU32Le(static_cast<std::uint32_t>(bits));
            return;
        default:
            writer.WriteU64Le(bits);
            return;
    }
}

bool ReadSized(wire::ByteReader& reader, std::size_t byte_length, std::uint64_t& out_bits) {
    switch (byte_length) {
        case 1: {
            wire::Byte value = 0;
            if (!reader.ReadU8(value)) {
                return false;
            }
            out_bits = value;
            return true;
        }
        case 2: {
            std::uint16_t value = 0;
            if (!reader.ReadU16Le(value)) {
                return false;
            }
            out_bits = value;
            return true;
        }
        case 4: {
            std::uint32_t value = 0;
            if (!reader.ReadU32Le(value)) {
                return false;
            }
            out_bits = value;
            return true;
        }
        default:
            return reader.ReadU64Le(out_bits);
    }
}

bool ToSigned(const Value& value, std::int64_t& out_value) {
    if (value.kind == ValueKind::Int) {
        out_value = value.int_value;
        return true;
    }
    if (value.kind == ValueKind::UInt &&
        value.uint_value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        out_value = static_cast<std::int64_t>(value.uint_value);
        return true;
    }
    return false;
}

bool ToUnsigned(const Value& value, std::uint64_t& out_value) {
    if (value.kind == ValueKind::UInt) {
        out_value = value.uint_value;
        return true;
    }
    if (value.kind == ValueKind::Int && value.int_value >= 0) {
        out_value = static_cast<std::uint64_t>(value.int_value);
        return true;
    }
    return false;
}

bool ToReal(const Value& value, double& out_value) {
    switch (value.kind) {
        case ValueKind::Real:
            out_value = value.real_value;
            return true;
        case ValueKind::Int:
            out_value = static_cast<double>(value.int_value);
            return true;
        case ValueKind::UInt:
            out_value = static_cast<double>(value.uint_value);
            return true;
        default:
            return false;
    }
}

}  // namespace

const char* IecKindName(IecKind kind) {
    switch (kind) {
        case IecKind::Bool:
            return "BOOL";
        case IecKind::Sint:
            return "SINT";
        case IecKind::Usint:
            return "USINT";
        case IecKind::Byte:
            return "BYTE";
        case IecKind::Int:
            return "INT";
        case IecKind::Uint:
            return "UINT";
        case IecKind::Word:
            return "WORD";
        case IecKind::Dint:
            return "DINT";
        case IecKind::Udint:
            return "UDINT";
        case IecKind::Dword:
            return "DWORD";
        case IecKind::Lint:
            return "LINT";
        case IecKind::Ulint:
            return "ULINT";
        case IecKind::Lword:
            return "LWORD";
        case IecKind::Real:
            return "REAL";
        case IecKind::Lreal:
            return "LREAL";
        case IecKind::String:
            return "STRING";
        case IecKind::Array:
            return "ARRAY";
        case IecKind::Struct:
            return "STRUCT";
    }

    return "UNKNOWN";
}

IecType::IecType(IecKind kind, std::size_t byte_length)
    : kind_(kind), byte_length_(byte_length) {}

std::shared_ptr<const IecType> IecType::Elementary(IecKind kind) {
    if (ClassOf(kind) == ScalarClass::Composite) {
        return nullptr;
    }
    return std::make_shared<IecType>(kind, ElementarySize(kind));
}

std::shared_ptr<const IecType> IecType::String(std::size_t max_length) {
    auto type = std::make_shared<IecType>(IecKind::String, max_length + 1);
    type->element_count_ = max_length;
    return type;
}

std::shared_ptr<const IecType> IecType::Array(
    std::shared_ptr<const IecType> element_type,
    std::int32_t lower_bound,
    std::size_t element_count) {
    if (element_type == nullptr) {
        return nullptr;
    }

    const std::size_t element_length = element_type->ByteLength();
    if (element_length != 0 && element_count > std::numeric_limits<std::size_t>::max() / element_length) {
        return nullptr;
    }

    auto type = std::make_shared<IecType>(IecKind::Array, element_length * element_count);
    type->element_type_ = std::move(element_type);
    type->lower_bound_ = lower_bound;
    type->element_count_ = element_count;
    return type;
}

std::shared_ptr<const IecType> IecType::Struct(std::vector<Member> members) {
    std::size_t byte_length = 0;
    for (const Member& member : members) {
        if (member.type == nullptr) {
            return nullptr;
        }
        if (member.type->ByteLength() > std::numeric_limits<std::size_t>::max() - byte_length) {
            return nullptr;
        }
        byte_length += member.type->ByteLength();
    }

    auto type = std::make_shared<IecType>(IecKind::Struct, byte_length);
    type->members_ = std::move(members);
    return type;
}

IecKind IecType::Kind() const {
    return kind_;
}

const std::shared_ptr<const IecType>& IecType::ElementType() const {
    return element_type_;
}

std::int32_t IecType::LowerBound() const {
    return lower_bound_;
}

std::size_t IecType::ElementCount() const {
    return element_count_;
}

const std::vector<IecType::Member>& IecType::Members() const {
    return members_;
}

std::string IecType::TypeName() const {
    switch (kind_) {
        case IecKind::String:
            return "STRING(" + std::to_string(element_count_) + ")";
        case IecKind::Array: {
            const std::int64_t upper_bound =
                static_cast<std::int64_t>(lower_bound_) + static_cast<std::int64_t>(element_count_) - 1;
            return "ARRAY[" + std::to_string(lower_bound_) + ".." + std::to_string(upper_bound) +
                "] OF " + element_type_->TypeName();
        }
        case IecKind::Struct: {
            std::string name = "STRUCT(";
            for (std::size_t index = 0; index < members_.size(); ++index) {
                if (index > 0) {
                    name += ", ";
                }
                name += members_[index].name + ":" + members_[index].type->TypeName();
            }
            name += ")";
            return name;
        }
        default:
            return IecKindName(kind_);
    }
}

std::size_t IecType::ByteLength() const {
    return byte_length_;
}

std::vector<ElementLayout> IecType::Elements() const {
    std::vector<ElementLayout> elements;
    CollectElements(0, std::string(), elements);
    return elements;
}

void IecType::CollectElements(
    std::size_t base_offset,
    const std::string& path,
    std::vector<ElementLayout>& out_elements) const {
    if (kind_ == IecKind::Array) {
        const std::size_t stride = element_type_->ByteLength();
        for (std::size_t index = 0; index < element_count_; ++index) {
            const std::int64_t iec_index = static_cast<std::int64_t>(lower_bound_) + static_cast<std::int64_t>(index);
            element_type_->CollectElements(
                base_offset + index * stride,
                path + "[" + std::to_string(iec_index) + "]",
                out_elements);
        }
        return;
    }

    if (kind_ == IecKind::Struct) {
        std::size_t member_offset = base_offset;
        for (const Member& member : members_) {
            member.type->CollectElements(
                member_offset,
                path.empty() ? member.name : path + "." + member.name,
                out_elements);
            member_offset += member.type->ByteLength();
        }
        return;
    }

    out_elements.push_back(ElementLayout{
        .start_index = base_offset,
        .byte_length = byte_length_,
        .name = path.empty() ? TypeName() : path,
    });
}

bool IecType::ConvertToBuffer(
    const Value& value,
    wire::ByteBuffer& out_buffer,
    std::string& out_error) const {
    wire::ByteWriter writer;
    writer.Reserve(byte_length_);
    if (!WriteValue(value, std::string(), writer, out_error)) {
        return false;
    }

    if (writer.Size() != byte_length_) {
        out_error = TypeName() + ": encoded " + std::to_string(writer.Size()) + " bytes, expected " +
            std::to_string(byte_length_);
        return false;
    }

    out_buffer = writer.TakeBuffer();
    out_error.clear();
    return true;
}

bool IecType::ConvertFromBuffer(
    wire::ByteSpan buffer,
    Value& out_value,
    std::string& out_error) const {
    if (buffer.size() != byte_length_) {
        out_error = TypeName() + ": expected " + std::to_string(byte_length_) + " bytes, got " +
            std::to_string(buffer.size());
        return false;
    }

    wire::ByteReader reader(buffer);
    Value value;
    if (!ReadValue(reader, value, out_error)) {
        return false;
    }

    out_value = std::move(value);
    out_error.clear();
    return true;
}

bool IecType::WriteValue(
    const Value& value,
    const std::string& path,
    wire::ByteWriter& writer,
    std::string& out_error) const {
    const std::string mismatch_prefix = DisplayPath(path) + ": " + TypeName() + " cannot hold ";

    switch (ClassOf(kind_)) {
        case ScalarClass::Boolean:
            if (value.kind != ValueKind::Bool) {
                out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
                return false;
            }
            writer.WriteU8(value.bool_value ? 1 : 0);
            return true;

        case ScalarClass::Signed: {
            std::int64_t signed_value = 0;
            if (!ToSigned(value, signed_value)) {
                out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
                return false;
            }
            if (byte_length_ < 8) {
                const std::int64_t limit = std::int64_t{1} << (byte_length_ * 8 - 1);
                if (signed_value < -limit || signed_value >= limit) {
                    out_error = mismatch_prefix + std::to_string(signed_value) + " (out of range)";
                    return false;
                }
            }
            WriteSized(writer, static_cast<std::uint64_t>(signed_value), byte_length_);
            return true;
        }

        case ScalarClass::Unsigned: {
            std::uint64_t unsigned_value = 0;
            if (!ToUnsigned(value, unsigned_value)) {
                out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
                return false;
            }
            if (byte_length_ < 8 && unsigned_value >= (std::uint64_t{1} << (byte_length_ * 8))) {
                out_error = mismatch_prefix + std::to_string(unsigned_value) + " (out of range)";
                return false;
            }
            WriteSized(writer, unsigned_value, byte_length_);
            return true;
        }

        case ScalarClass::Floating: {
            double real_value = 0.0;
            if (!ToReal(value, real_value)) {
                out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
                return false;
            }
            if (kind_ == IecKind::Real) {
                const float narrowed = static_cast<float>(real_value);
                std::uint32_t bits = 0;
                std::memcpy(&bits, &narrowed, sizeof(bits));
                writer.WriteU32Le(bits);
            } else {
                std::uint64_t bits = 0;
                std::memcpy(&bits, &real_value, sizeof(bits));
                writer.WriteU64Le(bits);
            }
            return true;
        }

        case ScalarClass::Composite:
            break;
    }

    if (kind_ == IecKind::String) {
        if (value.kind != ValueKind::String) {
            out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
            return false;
        }
        if (value.string_value.size() > element_count_) {
            out_error = DisplayPath(path) + ": string of " + std::to_string(value.string_value.size()) +
                " bytes exceeds " + TypeName();
            return false;
        }
        writer.WriteRawBytes(wire::ByteSpan(
            reinterpret_cast<const wire::Byte*>(value.string_value.data()),
            value.string_value.size()));
        writer.WriteZeros(byte_length_ - value.string_value.size());
        return true;
    }

    if (kind_ == IecKind::Array) {
        if (value.kind != ValueKind::Array) {
            out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
            return false;
        }
        if (value.items.size() != element_count_) {
            out_error = DisplayPath(path) + ": " + TypeName() + " expects " + std::to_string(element_count_) +
                " items, got " + std::to_string(value.items.size());
            return false;
        }
        for (std::size_t index = 0; index < element_count_; ++index) {
            const std::int64_t iec_index = static_cast<std::int64_t>(lower_bound_) + static_cast<std::int64_t>(index);
            if (!element_type_->WriteValue(
                    value.items[index],
                    path + "[" + std::to_string(iec_index) + "]",
                    writer,
                    out_error)) {
                return false;
            }
        }
        return true;
    }

    if (value.kind != ValueKind::Struct) {
        out_error = mismatch_prefix + ValueKindName(value.kind) + " value";
        return false;
    }
    for (const std::string& name : value.member_names) {
        bool declared = false;
        for (const Member& member : members_) {
            declared = declared || member.name == name;
        }
        if (!declared) {
            out_error = DisplayPath(path) + ": unknown member '" + name + "'";
            return false;
        }
    }
    for (const Member& member : members_) {
        const std::string member_path = path.empty() ? member.name : path + "." + member.name;
        const Value* member_value = value.FindMember(member.name);
        if (member_value == nullptr) {
            out_error = member_path + ": missing member";
            return false;
        }
        if (!member.type->WriteValue(*member_value, member_path, writer, out_error)) {
            return false;
        }
    }
    return true;
}

bool IecType::ReadValue(wire::ByteReader& reader, Value& out_value, std::string& out_error) const {
    const ScalarClass scalar_class = ClassOf(kind_);
    if (scalar_class != ScalarClass::Composite) {
        std::uint64_t bits = 0;
        if (!ReadSized(reader, byte_length_, bits)) {
            out_error = TypeName() + ": buffer ended early";
            return false;
        }

        if (scalar_class == ScalarClass::Boolean) {
            out_value = BoolValue(bits != 0);
        } else if (scalar_class == ScalarClass::Signed) {
            if (byte_length_ < 8 && (bits & (std::uint64_t{1} << (byte_length_ * 8 - 1))) != 0) {
                bits |= ~((std::uint64_t{1} << (byte_length_ * 8)) - 1);
            }
            out_value = IntValue(static_cast<std::int64_t>(bits));
        } else if (scalar_class == ScalarClass::Unsigned) {
            out_value = UIntValue(bits);
        } else if (kind_ == IecKind::Real) {
            const std::uint32_t narrow_bits = static_cast<std::uint32_t>(bits);
            float narrowed = 0.0F;
            std::memcpy(&narrowed, &narrow_bits, sizeof(narrowed));
            out_value = RealValue(static_cast<double>(narrowed));
        } else {
            double real_value = 0.0;
            std::memcpy(&real_value, &bits, sizeof(real_value));
            out_value = RealValue(real_value);
        }
        return true;
    }

    if (kind_ == IecKind::String) {
        wire::ByteSpan bytes;
        if (!reader.ReadRawBytes(byte_length_, bytes)) {
            out_error = TypeName() + ": buffer ended early";
            return false;
        }
        std::size_t length = 0;
        while (length < element_count_ && bytes[length] != 0) {
            ++length;
        }
        out_value = StringValue(std::string(reinterpret_cast<const char*>(bytes.data()), length));
        return true;
    }

    if (kind_ == IecKind::Array) {
        std::vector<Value> items(element_count_);
        for (Value& item : items) {
            if (!element_type_->ReadValue(reader, item, out_error)) {
                return false;
            }
        }
        out_value = ArrayValue(std::move(items));
        return true;
    }

    Value struct_value = StructValue();
    for (const Member& member : members_) {
        Value member_value;
        if (!member.type->ReadValue(reader, member_value, out_error)) {
            return false;
        }
        struct_value.AddMember(member.name, std::move(member_value));
    }
    out_value = std::move(struct_value);
    return true;
}

Value IecType::DefaultValue() const {
    switch (ClassOf(kind_)) {
        case ScalarClass::Boolean:
            return BoolValue(false);
        case ScalarClass::Signed:
            return IntValue(0);
        case ScalarClass::Unsigned:
            return UIntValue(0);
        case ScalarClass::Floating:
            return RealValue(0.0);
        case ScalarClass::Composite:
            break;
    }

    if (kind_ == IecKind::String) {
        return StringValue(std::string());
    }

    if (kind_ == IecKind::Array) {
        return ArrayValue(std::vector<Value>(element_count_, element_type_->DefaultValue()));
    }

    Value struct_value = StructValue();
    for (const Member& member : members_) {
        struct_value.AddMember(member.name, member.type->DefaultValue());
    }
    return struct_value;
}

namespace iec {

std::shared_ptr<const IecType> Bool() {
    return IecType::Elementary(IecKind::Bool);
}

std::shared_ptr<const IecType> Sint() {
    return IecType::Elementary(IecKind::Sint);
}

std::shared_ptr<const IecType> Usint() {
    return IecType::Elementary(IecKind::Usint);
}

std::shared_ptr<const IecType> Byte() {
    return IecType::Elementary(IecKind::Byte);
}

std::shared_ptr<const IecType> Int() {
    return IecType::Elementary(IecKind::Int);
}

std::shared_ptr<const IecType> Uint() {
    return IecType::Elementary(IecKind::Uint);
}

std::shared_ptr<const IecType> Word() {
    return IecType::Elementary(IecKind::Word);
}

std::shared_ptr<const IecType> Dint() {
    return IecType::Elementary(IecKind::Dint);
}

std::shared_ptr<const IecType> Udint() {
    return IecType::Elementary(IecKind::Udint);
}

std::shared_ptr<const IecType> Dword() {
    return IecType::Elementary(IecKind::Dword);
}

std::shared_ptr<const IecType> Lint() {
    return IecType::Elementary(IecKind::Lint);
}

std::shared_ptr<const IecType> Ulint() {
    return IecType::Elementary(IecKind::Ulint);
}

std::shared_ptr<const IecType> Lword() {
    return IecType::Elementary(IecKind::Lword);
}

std::shared_ptr<const IecType> Real() {
    return IecType::Elementary(IecKind::Real);
}

std::shared_ptr<const IecType> Lreal() {
    return IecType::Elementary(IecKind::Lreal);
}

std::shared_ptr<const IecType> String(std::size_t max_length) {
    return IecType::String(max_length);
}

}  // namespace iec

}  // namespace nvlink::schema
