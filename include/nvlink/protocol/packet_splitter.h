#pragma once

#include "schema/schema.h"
#include "wire/packet_header.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nvlink::protocol {

// Largest payload CODESYS accepts per NVL packet.
inline constexpr std::size_t kMaxPayloadBytes = 256;

// Packs whole elements of raw_message into packets of at most max_payload payload
// bytes, in element order. Elements are never split across packets, so an element
// larger than max_payload travels alone in an oversized packet. An empty element
// list still yields one header-only packet.
bool Split(
    std::uint16_t list_id,
    std::uint16_t counter,
    wire::ByteSpan raw_message,
    const std::vector<schema::ElementLayout>& elements,
    std::size_t max_payload,
    std::vector<wire::Packet>& out_packets,
    std::string& out_error);

}  // namespace nvlink::protocol
