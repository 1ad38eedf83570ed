#include "wire/byte_io.h"

#include <utility>

namespace nvlink::wire {
namespace {

template <typename Unsigned>
void AppendLittleEndian(ByteBuffer& buffer, Unsigned value) {
    for (std::size_t index = 0; index < sizeof(Unsigned); ++index) {
        buffer.push_back(static_cast<Byte>(value & 0xFFU));
        value = static_cast<Unsigned>(value >> 8U);
    }
}

template <typename Unsigned>
Unsigned LoadLittleEndian(ByteSpan bytes) {
    Unsigned value = 0;
    for (std::size_t index = sizeof(Unsigned); index > 0; --index) {
        value = static_cast<Unsigned>((value << 8U) | bytes[index - 1]);
    }
    return value;
}

}  // namespace

void ByteWriter::Clear() {
    buffer_.clear();
}

const ByteBuffer& ByteWriter::Buffer() const {
    return buffer_;
}

ByteBuffer&& ByteWriter::TakeBuffer() {
    return std::move(buffer_);
}

std::size_t ByteWriter::Size() const {
    return buffer_.size();
}

void ByteWriter::Reserve(std::size_t capacity) {
    buffer_.reserve(capacity);
}

void ByteWriter::WriteU8(Byte value) {
    buffer_.push_back(value);
}

void ByteWriter::WriteU16Le(std::uint16_t value) {
    AppendLittleEndian(buffer_, value);
}

void ByteWriter::WriteU32Le(std::uint32_t value) {
    AppendLittleEndian(buffer_, value);
}

void ByteWriter::WriteU64Le(std::uint64_t value) {
    AppendLittleEndian(buffer_, value);
}

void ByteWriter::WriteRawBytes(ByteSpan bytes) {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::WriteZeros(std::size_t count) {
    buffer_.insert(buffer_.end(), count, 0);
}

ByteReader::ByteReader(ByteSpan bytes) : bytes_(bytes) {}

std::size_t ByteReader::Offset() const {
    return offset_;
}

std::size_t ByteReader::Remaining() const {
    if (offset_ >= bytes_.size()) {
        return 0;
    }
    return bytes_.size() - offset_;
}

bool ByteReader::IsFullyConsumed() const {
    return offset_ == bytes_.size();
}

bool ByteReader::ReadU8(Byte& out_value) {
    if (offset_ >= bytes_.size()) {
        return false;
    }

    out_value = bytes_[offset_++];
    return true;
}

bool ByteReader::ReadU16Le(std::uint16_t& out_value) {
    ByteSpan bytes;
    if (!ReadRawBytes(sizeof(std::uint16_t), bytes)) {
        return false;
    }

    out_value = LoadLittleEndian<std::uint16_t>(bytes);
    return true;
}

bool ByteReader::ReadU32Le(std::uint32_t& out_value) {
    ByteSpan bytes;
    if (!ReadRawBytes(sizeof(std::uint32_t), bytes)) {
        return false;
    }

    out_value = LoadLittleEndian<std::uint32_t>(bytes);
    return true;
}

bool ByteReader::ReadU64Le(std::uint64_t& out_value) {
    ByteSpan bytes;
    if (!ReadRawBytes(sizeof(std::uint64_t), bytes)) {
        return false;
    }

    out_value = LoadLittleEndian<std::uint64_t>(bytes);
    return true;
}

bool ByteReader::ReadRawBytes(std::size_t length, ByteSpan& out_bytes) {
    if (length > Remaining()) {
        return false;
    }

    out_bytes = bytes_.subspan(offset_, length);
    offset_ += length;
    return true;
}

bool ByteReader::Skip(std::size_t length) {
    ByteSpan skipped;
    return ReadRawBytes(length, skipped);
}

std::string FormatHex(ByteSpan bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string text;
    text.reserve(bytes.size() * 2);
    for (const Byte byte : bytes) {
        text.push_back(kDigits[(byte >> 4U) & 0x0FU]);
        text.push_back(kDigits[byte & 0x0FU]);
    }
    return text;
}

}  // namespace nvlink::wire
