#include "protocol/fragment_assembler.h"
#include "protocol/listener_registry.h"
#include "protocol/packet_splitter.h"
#include "schema/iec_type.h"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

nvlink::wire::Packet MakeFragment(
    std::uint16_t list_id,
    std::uint16_t counter,
    std::uint16_t sub_index,
    std::size_t payload_size,
    nvlink::wire::Byte fill = 0xAB) {
    nvlink::wire::Packet packet{};
    packet.header.index = list_id;
    packet.header.counter = counter;
    packet.header.sub_index = sub_index;
    packet.header.variable_count = static_cast<std::uint16_t>(payload_size);
    packet.header.packet_length = static_cast<std::uint16_t>(nvlink::wire::kPacketHeaderSize + payload_size);
    packet.payload.assign(payload_size, fill);
    return packet;
}

struct RawSink final {
    std::vector<nvlink::wire::ByteBuffer> messages;

    nvlink::protocol::RawCallback Callback() {
        return [this](nvlink::wire::ByteSpan message, const nvlink::protocol::Listener&) {
            messages.emplace_back(message.begin(), message.end());
        };
    }
};

bool TestScenarioDeliversSplitMessage() {
    bool passed = true;
    std::string error;

    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);
    RawSink sink;
    registry.Register(50, 300, sink.Callback());

    nvlink::wire::ByteBuffer message(300);
    for (std::size_t index = 0; index < message.size(); ++index) {
        message[index] = static_cast<nvlink::wire::Byte>(index);
    }
    std::vector<nvlink::schema::ElementLayout> elements;
    for (std::size_t index = 0; index < message.size(); ++index) {
        elements.push_back({.start_index = index, .byte_length = 1, .name = {}});
    }
    std::vector<nvlink::wire::Packet> packets;
    passed &= Expect(
        nvlink::protocol::Split(50, 1, message, elements, nvlink::protocol::kMaxPayloadBytes, packets, error),
        "Scenario message should split.");
    passed &= Expect(packets.size() == 2, "Scenario message should need two fragments.");

    passed &= Expect(
        assembler.Ingest(packets[0]) == nvlink::protocol::IngestResult::Accumulating,
        "First fragment should accumulate.");
    passed &= Expect(assembler.PendingByteCount(50) == 256, "Entry should hold 256 bytes after fragment 0.");
    passed &= Expect(sink.messages.empty(), "No callback before completion.");
    passed &= Expect(
        assembler.Ingest(packets[1]) == nvlink::protocol::IngestResult::Delivered,
        "Second fragment should complete the message.");
    passed &= Expect(sink.messages.size() == 1, "Listener should fire exactly once.");
    passed &= Expect(!sink.messages.empty() && sink.messages[0] == message, "Listener should get the sent bytes.");
    passed &= Expect(assembler.HasEntry(50), "Delivered entry should stay as handled.");
    passed &= Expect(assembler.PendingByteCount(50) == 0, "Handled entry should hold no pending bytes.");

    passed &= Expect(
        assembler.Ingest(packets[1]) == nvlink::protocol::IngestResult::OrphanFragment,
        "Late fragment after delivery should be orphaned.");
    passed &= Expect(sink.messages.size() == 1, "Orphan should not trigger a callback.");
    return passed;
}

bool TestUnregisteredListLeavesNoEntry() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);
    RawSink sink;
    registry.Register(50, 4, sink.Callback());

    passed &= Expect(
        assembler.Ingest(MakeFragment(77, 0, 0, 4)) == nvlink::protocol::IngestResult::UnregisteredList,
        "Data for an unknown list should be unregistered.");
    passed &= Expect(!assembler.HasEntry(77), "Unregistered list should leave no entry.");
    passed &= Expect(assembler.EntryCount() == 0, "No entry should be retained at all.");
    passed &= Expect(sink.messages.empty(), "No listener should fire.");
    passed &= Expect(
        assembler.DiagnosticsSnapshot().unregistered_list_count == 1,
        "Unregistered data should be counted.");

    // Several messages, each split across several fragments.
    for (std::uint16_t counter = 1; counter <= 3; ++counter) {
        for (std::uint16_t sub_index = 0; sub_index < 3; ++sub_index) {
            const nvlink::protocol::IngestResult expected = sub_index == 0
                ? nvlink::protocol::IngestResult::UnregisteredList
                : nvlink::protocol::IngestResult::OrphanFragment;
            passed &= Expect(
                assembler.Ingest(MakeFragment(77, counter, sub_index, 100)) == expected,
                "First fragment should be unregistered, later ones orphaned.");
            passed &= Expect(!assembler.HasEntry(77), "No fragment for an unknown list should leave an entry.");
        }
    }
    const nvlink::protocol::AssemblerDiagnosticsSnapshot diagnostics = assembler.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.unregistered_list_count == 4, "Each new message should count as unregistered.");
    passed &= Expect(diagnostics.orphan_fragment_count == 6, "Continuation fragments should count as orphans.");
    passed &= Expect(assembler.EntryCount() == 0, "Unknown list traffic should leave the assembler empty.");
    passed &= Expect(sink.messages.empty(), "Registered listener for another list should never fire.");
    return passed;
}

bool TestGapDropsMessage() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);
    RawSink sink;
    registry.Register(5, 1024, sink.Callback());

    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 3, 0, 256)) == nvlink::protocol::IngestResult::Accumulating,
        "Fragment 0 should accumulate.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 3, 1, 256)) == nvlink::protocol::IngestResult::Accumulating,
        "Fragment 1 should accumulate.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 3, 3, 256)) == nvlink::protocol::IngestResult::PacketLossDetected,
        "Fragment 3 after 1 should report packet loss.");
    passed &= Expect(!assembler.HasEntry(5), "Packet loss should delete the entry.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 3, 2, 256)) == nvlink::protocol::IngestResult::OrphanFragment,
        "The missing fragment arriving late should be orphaned.");
    passed &= Expect(sink.messages.empty(), "A message with a gap should never be delivered.");

    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 4, 0, 256)) == nvlink::protocol::IngestResult::Accumulating,
        "Next message should start cleanly.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(5, 4, 0, 256)) == nvlink::protocol::IngestResult::PacketLossDetected,
        "Repeated fragment 0 should count as a gap.");

    const nvlink::protocol::AssemblerDiagnosticsSnapshot diagnostics = assembler.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.packet_loss_count == 2, "Both gaps should be counted.");
    passed &= Expect(diagnostics.orphan_fragment_count == 1, "Orphan should be counted.");
    passed &= Expect(diagnostics.ingested_fragment_count == 6, "Every fragment should be counted as ingested.");
    return passed;
}

bool TestCompletenessGate() {
    bool passed = true;

    {
        nvlink::protocol::ListenerRegistry registry;
        nvlink::protocol::FragmentAssembler assembler(registry);
        RawSink sink;
        registry.Register(8, 10, sink.Callback());
        passed &= Expect(
            assembler.Ingest(MakeFragment(8, 1, 0, 9)) == nvlink::protocol::IngestResult::Accumulating,
            "E-1 bytes should keep accumulating.");
        passed &= Expect(sink.messages.empty(), "E-1 bytes should not deliver.");
        passed &= Expect(assembler.PendingByteCount(8) == 9, "E-1 bytes should be pending.");
    }

    {
        nvlink::protocol::ListenerRegistry registry;
        nvlink::protocol::FragmentAssembler assembler(registry);
        RawSink sink;
        registry.Register(8, 10, sink.Callback());
        passed &= Expect(
            assembler.Ingest(MakeFragment(8, 1, 0, 10)) == nvlink::protocol::IngestResult::Delivered,
            "Exactly E bytes should deliver.");
        passed &= Expect(sink.messages.size() == 1, "E bytes should fire once.");
    }

    {
        nvlink::protocol::ListenerRegistry registry;
        nvlink::protocol::FragmentAssembler assembler(registry);
        RawSink sink;
        registry.Register(8, 10, sink.Callback());
        passed &= Expect(
            assembler.Ingest(MakeFragment(8, 1, 0, 11)) == nvlink::protocol::IngestResult::SizeMismatch,
            "E+1 bytes should report a size mismatch.");
        passed &= Expect(sink.messages.empty(), "E+1 bytes should not deliver.");
        passed &= Expect(assembler.HasEntry(8), "Size mismatch should keep the entry.");
        passed &= Expect(assembler.PendingByteCount(8) == 11, "Size mismatch should keep the bytes.");
        passed &= Expect(
            assembler.DiagnosticsSnapshot().size_mismatch_count == 1,
            "Size mismatch should be counted.");
    }

    return passed;
}

bool TestSupersededMessage() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);
    RawSink sink;
    registry.Register(9, 20, sink.Callback());

    passed &= Expect(
        assembler.Ingest(MakeFragment(9, 10, 0, 12, 0x01)) == nvlink::protocol::IngestResult::Accumulating,
        "Counter 10 should start accumulating.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(9, 11, 1, 8)) == nvlink::protocol::IngestResult::Superseded,
        "Mid-message fragment of a new counter should supersede and be dropped.");
    passed &= Expect(!assembler.HasEntry(9), "Superseded entry should be gone.");

    passed &= Expect(
        assembler.Ingest(MakeFragment(9, 12, 0, 12, 0x02)) == nvlink::protocol::IngestResult::Accumulating,
        "Counter 12 should start accumulating.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(9, 13, 0, 12, 0x03)) == nvlink::protocol::IngestResult::Accumulating,
        "Fragment 0 of counter 13 should replace counter 12.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(9, 13, 1, 8, 0x03)) == nvlink::protocol::IngestResult::Delivered,
        "Counter 13 should complete.");
    passed &= Expect(
        sink.messages.size() == 1 && sink.messages[0] == nvlink::wire::ByteBuffer(20, 0x03),
        "Only the newest message should be delivered.");
    passed &= Expect(assembler.DiagnosticsSnapshot().superseded_count == 2, "Both supersessions should be counted.");
    return passed;
}

bool TestCounterWrap() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);
    RawSink sink;
    registry.Register(1, 2, sink.Callback());

    passed &= Expect(
        assembler.Ingest(MakeFragment(1, 65535, 0, 2, 0x10)) == nvlink::protocol::IngestResult::Delivered,
        "Counter 65535 should deliver.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(1, 0, 0, 2, 0x20)) == nvlink::protocol::IngestResult::Delivered,
        "Counter 0 after 65535 should start a new message.");
    passed &= Expect(sink.messages.size() == 2, "Both sides of the wrap should deliver.");
    passed &= Expect(
        sink.messages.size() == 2 && sink.messages[1] == nvlink::wire::ByteBuffer(2, 0x20),
        "Wrapped message should carry its own bytes.");
    return passed;
}

bool TestEveryListenerConverts() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);

    std::vector<std::string> seen;
    registry.Register(
        3,
        nvlink::schema::iec::Dint(),
        [&seen](const nvlink::schema::Value& value, const nvlink::protocol::Listener&) {
            seen.push_back("dint=" + nvlink::schema::FormatValue(value));
        });
    registry.Register(
        3,
        nvlink::schema::iec::Lreal(),
        [&seen](const nvlink::schema::Value&, const nvlink::protocol::Listener&) {
            seen.push_back("lreal");
        });
    std::shared_ptr<const nvlink::schema::IecType> words;
    std::string error;
    passed &= Expect(
        nvlink::schema::TryParseIecType("ARRAY[0..1] OF WORD", words, error),
        "Word array type should parse.");
    registry.Register(
        3,
        words,
        [&seen](const nvlink::schema::Value& value, const nvlink::protocol::Listener&) {
            seen.push_back("words=" + nvlink::schema::FormatValue(value));
        });

    nvlink::wire::Packet packet = MakeFragment(3, 0, 0, 4);
    packet.payload = {0x01, 0x00, 0x02, 0x00};
    passed &= Expect(
        assembler.Ingest(packet) == nvlink::protocol::IngestResult::Delivered,
        "Message should complete against the first listener's length.");
    passed &= Expect(
        seen == std::vector<std::string>{"dint=131073", "words=[1, 2]"},
        "Matching listeners should fire in registration order.");
    passed &= Expect(
        assembler.DiagnosticsSnapshot().conversion_failure_count == 1,
        "Listener with a mismatched schema should count a conversion failure.");
    return passed;
}

bool TestCallbackMayUnregister() {
    bool passed = true;
    nvlink::protocol::ListenerRegistry registry;
    nvlink::protocol::FragmentAssembler assembler(registry);

    int calls = 0;
    nvlink::protocol::ListenerHandle handle = nvlink::protocol::kInvalidListenerHandle;
    handle = registry.Register(
        4,
        1,
        [&](nvlink::wire::ByteSpan, const nvlink::protocol::Listener& listener) {
            ++calls;
            registry.Unregister(listener.handle);
        });
    RawSink sink;
    registry.Register(4, 1, sink.Callback());

    passed &= Expect(handle != nvlink::protocol::kInvalidListenerHandle, "Registration should return a handle.");
    passed &= Expect(
        assembler.Ingest(MakeFragment(4, 0, 0, 1)) == nvlink::protocol::IngestResult::Delivered,
        "Single-byte message should deliver.");
    passed &= Expect(calls == 1, "Self-removing listener should fire once.");
    passed &= Expect(sink.messages.size() == 1, "Second listener should still fire in the same dispatch.");
    passed &= Expect(registry.Size() == 1, "Self-removing listener should be gone.");

    passed &= Expect(
        assembler.Ingest(MakeFragment(4, 1, 0, 1)) == nvlink::protocol::IngestResult::Delivered,
        "Next message should still deliver.");
    passed &= Expect(calls == 1, "Removed listener should not fire again.");
    passed &= Expect(sink.messages.size() == 2, "Remaining listener should fire again.");

    assembler.Clear();
    passed &= Expect(assembler.EntryCount() == 0, "Clear should drop every entry.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    passed &= Expect(TestScenarioDeliversSplitMessage(), "Split message should reassemble and deliver.");
    passed &= Expect(TestUnregisteredListLeavesNoEntry(), "Unregistered list should be dropped.");
    passed &= Expect(TestGapDropsMessage(), "Fragment gaps should drop the message.");
    passed &= Expect(TestCompletenessGate(), "Completeness gate should hold at E-1, E and E+1.");
    passed &= Expect(TestSupersededMessage(), "New counters should supersede partial messages.");
    passed &= Expect(TestCounterWrap(), "Counter wrap should start a new message.");
    passed &= Expect(TestEveryListenerConverts(), "Every listener should get a conversion attempt.");
    passed &= Expect(TestCallbackMayUnregister(), "Callbacks should be free to unregister.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] nvlink_fragment_assembler_tests\n";
    return 0;
}
