#include "protocol/fragment_assembler.h"

#include "core/logger.h"

#include <string>
#include <utility>

namespace nvlink::protocol {
namespace {

constexpr const char* kLogModule = "nvl.assembler";

std::string DescribeFragment(const wire::Packet& packet) {
    return "list=" + std::to_string(packet.header.index) + " counter=" + std::to_string(packet.header.counter) +
        " sub_index=" + std::to_string(packet.header.sub_index);
}

}  // namespace

const char* IngestResultName(IngestResult result) {
    switch (result) {
        case IngestResult::Accumulating:
            return "accumulating";
        case IngestResult::Delivered:
            return "delivered";
        case IngestResult::OrphanFragment:
            return "orphan_fragment";
        case IngestResult::PacketLossDetected:
            return "packet_loss_detected";
        case IngestResult::Superseded:
            return "superseded";
        case IngestResult::UnregisteredList:
            return "unregistered_list";
        case IngestResult::SizeMismatch:
            return "size_mismatch";
    }

    return "unknown";
}

FragmentAssembler::FragmentAssembler(const ListenerRegistry& registry) : registry_(registry) {}

IngestResult FragmentAssembler::Ingest(const wire::Packet& packet) {
    ++diagnostics_.ingested_fragment_count;

    const std::uint16_t list_id = packet.header.index;
    const std::uint16_t sub_index = packet.header.sub_index;
    if (static_cast<std::size_t>(packet.header.packet_length) != wire::kPacketHeaderSize + packet.payload.size()) {
        core::Logger::Debug(
            kLogModule,
            "packet_length " + std::to_string(packet.header.packet_length) + " disagrees with " +
                std::to_string(wire::kPacketHeaderSize + packet.payload.size()) + " received bytes ("
                + DescribeFragment(packet) + ").");
    }

    const auto it = entries_.find(list_id);
    if (it != entries_.end() && !it->second.handled) {
        BufferEntry& entry = it->second;
        if (entry.counter == packet.header.counter) {
            if (static_cast<std::uint32_t>(sub_index) != static_cast<std::uint32_t>(entry.last_sub_index) + 1) {
                core::Logger::Debug(
                    kLogModule,
                    "Fragment gap after sub_index " + std::to_string(entry.last_sub_index) + ", dropping message ("
                        + DescribeFragment(packet) + ").");
                entries_.erase(it);
                ++diagnostics_.packet_loss_count;
                return IngestResult::PacketLossDetected;
            }

            entry.last_sub_index = sub_index;
            entry.total_bytes += packet.payload.size();
            entry.fragments.push_back(packet.payload);
            return CheckCompleteness(list_id, entry);
        }

        core::Logger::Debug(
            kLogModule,
            "Counter " + std::to_string(entry.counter) + " superseded before completion ("
                + DescribeFragment(packet) + ").");
        entries_.erase(it);
        ++diagnostics_.superseded_count;
        if (sub_index != 0) {
            return IngestResult::Superseded;
        }
    } else if (sub_index != 0) {
        core::Logger::Debug(kLogModule, "Orphan fragment dropped (" + DescribeFragment(packet) + ").");
        ++diagnostics_.orphan_fragment_count;
        return IngestResult::OrphanFragment;
    }

    BufferEntry& entry = entries_[list_id];
    entry = BufferEntry{
        .counter = packet.header.counter,
        .last_sub_index = 0,
        .fragments = {packet.payload},
        .total_bytes = packet.payload.size(),
        .handled = false,
    };
    return CheckCompleteness(list_id, entry);
}

IngestResult FragmentAssembler::CheckCompleteness(std::uint16_t list_id, BufferEntry& entry) {
    const std::vector<Listener> listeners = registry_.Lookup(list_id);
    if (listeners.empty()) {
        core::Logger::Debug(kLogModule, "No listener for list " + std::to_string(list_id) + ", data dropped.");
        entries_.erase(list_id);
        ++diagnostics_.unregistered_list_count;
        return IngestResult::UnregisteredList;
    }

    const std::size_t expected_byte_length = listeners.front().expected_byte_length;
    if (entry.total_bytes < expected_byte_length) {
        return IngestResult::Accumulating;
    }
    if (entry.total_bytes > expected_byte_length) {
        core::Logger::Warn(
            kLogModule,
            "List " + std::to_string(list_id) + " received " + std::to_string(entry.total_bytes) +
                " bytes, expected " + std::to_string(expected_byte_length) + ".");
        ++diagnostics_.size_mismatch_count;
        return IngestResult::SizeMismatch;
    }

    wire::ByteBuffer message;
    message.reserve(entry.total_bytes);
    for (const wire::ByteBuffer& fragment : entry.fragments) {
        message.insert(message.end(), fragment.begin(), fragment.end());
    }
    core::Logger::Debug(
        kLogModule,
        "List " + std::to_string(list_id) + " counter " + std::to_string(entry.counter) + " complete in " +
            std::to_string(entry.fragments.size()) + " fragment(s), " + std::to_string(message.size()) + " bytes.");

    entry.handled = true;
    entry.fragments.clear();
    entry.total_bytes = 0;
    ++diagnostics_.delivered_message_count;

    Dispatch(listeners, message);
    return IngestResult::Delivered;
}

void FragmentAssembler::Dispatch(const std::vector<Listener>& listeners, const wire::ByteBuffer& message) {
    for (const Listener& listener : listeners) {
        if (listener.schema == nullptr) {
            if (listener.raw_callback) {
                listener.raw_callback(wire::ByteSpan(message), listener);
            }
            continue;
        }

        schema::Value value;
        std::string error;
        if (!listener.schema->ConvertFromBuffer(message, value, error)) {
            core::Logger::Warn(
                kLogModule,
                "List " + std::to_string(listener.list_id) + " listener " + std::to_string(listener.handle) +
                    " could not convert message: " + error);
            ++diagnostics_.conversion_failure_count;
            continue;
        }
        if (listener.value_callback) {
            listener.value_callback(value, listener);
        }
    }
}

bool FragmentAssembler::HasEntry(std::uint16_t list_id) const {
    return entries_.find(list_id) != entries_.end();
}

std::size_t FragmentAssembler::PendingByteCount(std::uint16_t list_id) const {
    const auto it = entries_.find(list_id);
    return it == entries_.end() ? 0 : it->second.total_bytes;
}

std::size_t FragmentAssembler::EntryCount() const {
    return entries_.size();
}

void FragmentAssembler::Clear() {
    entries_.clear();
}

AssemblerDiagnosticsSnapshot FragmentAssembler::DiagnosticsSnapshot() const {
    return diagnostics_;
}

}  // namespace nvlink::protocol
