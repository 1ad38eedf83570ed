#include "protocol/packet_splitter.h"

#include "core/logger.h"

#include <limits>
#include <utility>

namespace nvlink::protocol {
namespace {

constexpr const char* kLogModule = "nvl.splitter";
constexpr std::size_t kMaxHeaderField = std::numeric_limits<std::uint16_t>::max();

wire::Packet MakeEmptyPacket(std::uint16_t list_id, std::uint16_t counter, std::uint16_t sub_index) {
    wire::Packet packet;
    packet.header.index = list_id;
    packet.header.counter = counter;
    packet.header.sub_index = sub_index;
    return packet;
}

}  // namespace

bool Split(
    std::uint16_t list_id,
    std::uint16_t counter,
    wire::ByteSpan raw_message,
    const std::vector<schema::ElementLayout>& elements,
    std::size_t max_payload,
    std::vector<wire::Packet>& out_packets,
    std::string& out_error) {
    std::vector<wire::Packet> packets;
    wire::Packet packet = MakeEmptyPacket(list_id, counter, 0);

    for (const schema::ElementLayout& element : elements) {
        if (element.start_index > raw_message.size() ||
            element.byte_length > raw_message.size() - element.start_index) {
            out_error = "element '" + element.name + "' [" + std::to_string(element.start_index) + ", +" +
                std::to_string(element.byte_length) + ") lies outside the " + std::to_string(raw_message.size()) +
                "-byte message";
            return false;
        }

        if (packet.header.variable_count > 0 && packet.payload.size() + element.byte_length > max_payload) {
            if (packet.header.sub_index == kMaxHeaderField) {
                out_error = "message needs more than 65536 packets";
                return false;
            }
            const std::uint16_t next_sub_index = static_cast<std::uint16_t>(packet.header.sub_index + 1);
            packets.push_back(std::move(packet));
            packet = MakeEmptyPacket(list_id, counter, next_sub_index);
        }

        if (packet.header.variable_count == kMaxHeaderField ||
            packet.payload.size() + element.byte_length > kMaxHeaderField - wire::kPacketHeaderSize) {
            out_error = "packet " + std::to_string(packet.header.sub_index) + " overflows the 16-bit header fields";
            return false;
        }

        const wire::ByteSpan element_bytes = raw_message.subspan(element.start_index, element.byte_length);
        packet.payload.insert(packet.payload.end(), element_bytes.begin(), element_bytes.end());
        ++packet.header.variable_count;
        packet.header.packet_length = static_cast<std::uint16_t>(wire::kPacketHeaderSize + packet.payload.size());
    }
    packets.push_back(std::move(packet));

    core::Logger::Debug(
        kLogModule,
        "List " + std::to_string(list_id) + " counter " + std::to_string(counter) + ": " +
            std::to_string(raw_message.size()) + " bytes in " + std::to_string(elements.size()) + " element(s) -> " +
            std::to_string(packets.size()) + " packet(s).");

    out_packets = std::move(packets);
    out_error.clear();
    return true;
}

}  // namespace nvlink::protocol
