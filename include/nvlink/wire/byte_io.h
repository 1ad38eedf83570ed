#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nvlink::wire {

using Byte = std::uint8_t;
using ByteBuffer = std::vector<Byte>;
using ByteSpan = std::span<const Byte>;

// All multi-byte values on the NVL wire are little-endian.
class ByteWriter final {
public:
    void Clear();
    const ByteBuffer& Buffer() const;
    ByteBuffer&& TakeBuffer();
    std::size_t Size() const;

    void Reserve(std::size_t capacity);
    void WriteU8(Byte value);
    void WriteU16Le(std::uint16_t value);
    void WriteU32Le(std::uint32_t value);
    void WriteU64Le(std::uint64_t value);
    void WriteRawBytes(ByteSpan bytes);
    void WriteZeros(std::size_t count);

private:
    ByteBuffer buffer_;
};

class ByteReader final {
public:
    explicit ByteReader(ByteSpan bytes);

    std::size_t Offset() const;
    std::size_t Remaining() const;
    bool IsFullyConsumed() const;

    bool ReadU8(Byte& out_value);
    bool ReadU16Le(std::uint16_t& out_value);
    bool ReadU32Le(std::uint32_t& out_value);
    bool ReadU64Le(std::uint64_t& out_value);
    bool ReadRawBytes(std::size_t length, ByteSpan& out_bytes);
    bool Skip(std::size_t length);

private:
    ByteSpan bytes_;
    std::size_t offset_ = 0;
};

std::string FormatHex(ByteSpan bytes);

}  // namespace nvlink::wire
