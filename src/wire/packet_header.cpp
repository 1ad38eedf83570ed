#include "wire/packet_header.h"

namespace nvlink::wire {

std::size_t PacketHeader::PayloadLength() const {
    if (packet_length < kPacketHeaderSize) {
        return 0;
    }
    return packet_length - kPacketHeaderSize;
}

void EncodePacketHeader(const PacketHeader& header, ByteBuffer& out_bytes) {
    ByteWriter writer;
    writer.Reserve(kPacketHeaderSize);
    writer.WriteRawBytes(ByteSpan(header.identity.data(), header.identity.size()));
    writer.WriteU32Le(header.type);
    writer.WriteU16Le(header.index);
    writer.WriteU16Le(header.sub_index);
    writer.WriteU16Le(header.variable_count);
    writer.WriteU16Le(header.packet_length);
    writer.WriteU16Le(header.counter);
    writer.WriteU8(header.flags);
    writer.WriteU8(header.checksum);

    out_bytes = writer.TakeBuffer();
}

bool TryDecodePacketHeader(ByteSpan bytes, PacketHeader& out_header, std::string& out_error) {
    out_header = {};

    if (bytes.size() < kPacketHeaderSize) {
        out_error = "malformed header: " + std::to_string(bytes.size()) + " bytes, expected at least " +
            std::to_string(kPacketHeaderSize);
        return false;
    }

    ByteReader reader(bytes.first(kPacketHeaderSize));
    ByteSpan identity;
    PacketHeader header{};
    if (!reader.ReadRawBytes(header.identity.size(), identity) ||
        !reader.ReadU32Le(header.type) ||
        !reader.ReadU16Le(header.index) ||
        !reader.ReadU16Le(header.sub_index) ||
        !reader.ReadU16Le(header.variable_count) ||
        !reader.ReadU16Le(header.packet_length) ||
        !reader.ReadU16Le(header.counter) ||
        !reader.ReadU8(header.flags) ||
        !reader.ReadU8(header.checksum)) {
        out_error = "malformed header: truncated field";
        return false;
    }

    for (std::size_t index = 0; index < header.identity.size(); ++index) {
        header.identity[index] = identity[index];
    }

    out_header = header;
    out_error.clear();
    return true;
}

void EncodePacket(const Packet& packet, ByteBuffer& out_datagram) {
    EncodePacketHeader(packet.header, out_datagram);
    out_datagram.insert(out_datagram.end(), packet.payload.begin(), packet.payload.end());
}

bool TryDecodePacket(ByteSpan datagram, Packet& out_packet, std::string& out_error) {
    out_packet = {};

    if (!TryDecodePacketHeader(datagram, out_packet.header, out_error)) {
        return false;
    }

    const ByteSpan payload = datagram.subspan(kPacketHeaderSize);
    out_packet.payload.assign(payload.begin(), payload.end());
    return true;
}

std::vector<std::string> PacketFlagNames(std::uint8_t flags) {
    std::vector<std::string> names;
    if ((flags & kPacketFlagAckRequested) != 0) {
        names.emplace_back("SendAckRequested");
    }
    if ((flags & kPacketFlagChecksumIncluded) != 0) {
        names.emplace_back("ChecksumIncluded");
    }
    if ((flags & kPacketFlagInvalidChecksum) != 0) {
        names.emplace_back("InvalidChecksum");
    }
    return names;
}

std::string DescribePacketHeader(const PacketHeader& header) {
    std::string flags_text;
    for (const std::string& name : PacketFlagNames(header.flags)) {
        if (!flags_text.empty()) {
            flags_text += '|';
        }
        flags_text += name;
    }
    if (flags_text.empty()) {
        flags_text = "none";
    }

    return "list=" + std::to_string(header.index) +
        " sub=" + std::to_string(header.sub_index) +
        " counter=" + std::to_string(header.counter) +
        " vars=" + std::to_string(header.variable_count) +
        " len=" + std::to_string(header.packet_length) +
        " type=" + std::to_string(header.type) +
        " flags=" + flags_text;
}

}  // namespace nvlink::wire
