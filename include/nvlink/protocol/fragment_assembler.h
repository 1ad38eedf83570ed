#pragma once

#include "protocol/listener_registry.h"
#include "wire/packet_header.h"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace nvlink::protocol {

enum class IngestResult : std::uint8_t {
    Accumulating = 0,
    Delivered = 1,
    OrphanFragment = 2,
    PacketLossDetected = 3,
    // Previous message dropped by a new counter. A new message starting with the
    // same fragment reports its own completeness result instead.
    Superseded = 4,
    UnregisteredList = 5,
    SizeMismatch = 6,
};

const char* IngestResultName(IngestResult result);

struct AssemblerDiagnosticsSnapshot final {
    std::uint64_t ingested_fragment_count = 0;
    std::uint64_t orphan_fragment_count = 0;
    std::uint64_t packet_loss_count = 0;
    std::uint64_t superseded_count = 0;
    std::uint64_t unregistered_list_count = 0;
    std::uint64_t size_mismatch_count = 0;
    std::uint64_t delivered_message_count = 0;
    std::uint64_t conversion_failure_count = 0;
};

// Reassembles fragmented NVL messages per list ID and dispatches complete ones.
//
// Fragments of one message share a counter and arrive with sub_index 0, 1, 2, ...
// Any gap drops the whole message; a new counter drops the message in progress.
// A message is complete when its payload total equals the expected byte length of
// the first listener registered for the list ID. Every listener for that list ID
// is then invoked, each converting through its own schema.
class FragmentAssembler final {
public:
    explicit FragmentAssembler(const ListenerRegistry& registry);

    IngestResult Ingest(const wire::Packet& packet);

    bool HasEntry(std::uint16_t list_id) const;
    std::size_t PendingByteCount(std::uint16_t list_id) const;
    std::size_t EntryCount() const;
    void Clear();

    AssemblerDiagnosticsSnapshot DiagnosticsSnapshot() const;

private:
    struct BufferEntry final {
        std::uint16_t counter = 0;
        std::uint16_t last_sub_index = 0;
        std::vector<wire::ByteBuffer> fragments;
        std::size_t total_bytes = 0;
        bool handled = false;
    };

    IngestResult CheckCompleteness(std::uint16_t list_id, BufferEntry& entry);
    void Dispatch(const std::vector<Listener>& listeners, const wire::ByteBuffer& message);

    const ListenerRegistry& registry_;
    std::unordered_map<std::uint16_t, BufferEntry> entries_;
    AssemblerDiagnosticsSnapshot diagnostics_{};
};

}  // namespace nvlink::protocol
