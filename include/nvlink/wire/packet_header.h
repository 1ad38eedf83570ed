#pragma once

#include "wire/byte_io.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nvlink::wire {

inline constexpr std::size_t kPacketHeaderSize = 20;
inline constexpr std::array<Byte, 4> kNvlIdentity = {0x00, 0x2D, 0x53, 0x33};
inline constexpr std::uint32_t kMessageTypeNetworkVariable = 0;

inline constexpr std::uint8_t kPacketFlagAckRequested = 0x01;
inline constexpr std::uint8_t kPacketFlagChecksumIncluded = 0x02;
inline constexpr std::uint8_t kPacketFlagInvalidChecksum = 0x04;

struct PacketHeader final {
    std::array<Byte, 4> identity = kNvlIdentity;
    std::uint32_t type = kMessageTypeNetworkVariable;
    std::uint16_t index = 0;
    std::uint16_t sub_index = 0;
    std::uint16_t variable_count = 0;
    std::uint16_t packet_length = static_cast<std::uint16_t>(kPacketHeaderSize);
    std::uint16_t counter = 0;
    std::uint8_t flags = 0;
    // Carried as-is; never computed or verified.
    std::uint8_t checksum = 0;

    // packet_length minus the header, clamped at zero for truncated headers.
    std::size_t PayloadLength() const;
};

struct Packet final {
    PacketHeader header{};
    ByteBuffer payload;
};

void EncodePacketHeader(const PacketHeader& header, ByteBuffer& out_bytes);

bool TryDecodePacketHeader(ByteSpan bytes, PacketHeader& out_header, std::string& out_error);

void EncodePacket(const Packet& packet, ByteBuffer& out_datagram);

// The payload is everything after the header, regardless of packet_length.
bool TryDecodePacket(ByteSpan datagram, Packet& out_packet, std::string& out_error);

std::vector<std::string> PacketFlagNames(std::uint8_t flags);

std::string DescribePacketHeader(const PacketHeader& header);

}  // namespace nvlink::wire
