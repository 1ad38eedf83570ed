#pragma once

#include "schema/value.h"
#include "wire/byte_io.h"

#include <cstddef>
#include <string>
#include <vector>

namespace nvlink::schema {

// One leaf field of a serialized message, in wire order.
struct ElementLayout final {
    std::size_t start_index = 0;
    std::size_t byte_length = 0;
    std::string name;
};

// Knows the byte layout of one NVL message type and converts values to and from it.
class ISchema {
public:
    virtual ~ISchema() = default;

    virtual std::string TypeName() const = 0;
    virtual std::size_t ByteLength() const = 0;
    virtual std::vector<ElementLayout> Elements() const = 0;
    virtual bool ConvertToBuffer(
        const Value& value,
        wire::ByteBuffer& out_buffer,
        std::string& out_error) const = 0;
    virtual bool ConvertFromBuffer(
        wire::ByteSpan buffer,
        Value& out_value,
        std::string& out_error) const = 0;
};

}  // namespace nvlink::schema
