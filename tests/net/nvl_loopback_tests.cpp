#include "net/nvl_receiver.h"
#include "net/nvl_sender.h"
#include "schema/iec_type.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

void PollUntil(nvlink::net::NvlReceiver& receiver, const std::vector<nvlink::schema::Value>& values, std::size_t count) {
    for (int index = 0; index < 500 && values.size() < count; ++index) {
        if (receiver.Poll() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

}  // namespace

int main() {
    bool passed = true;
    std::string error;

    std::shared_ptr<const nvlink::schema::IecType> record;
    passed &= Expect(
        nvlink::schema::TryParseIecType(
            "STRUCT(counter:DINT, temps:ARRAY[0..99] OF REAL, name:STRING(40), running:BOOL)",
            record,
            error),
        "Record type should parse.");
    passed &= Expect(record->ByteLength() == 446, "Record should be 446 bytes.");

    nvlink::net::NvlReceiver receiver({
        .listening_port = 0,
        .local_address = "127.0.0.1",
        .require_identity_match = true,
    });
    std::vector<nvlink::schema::Value> values;
    receiver.AddHandler(
        7,
        record,
        [&values](const nvlink::schema::Value& value, const nvlink::protocol::Listener&) { values.push_back(value); });
    passed &= Expect(receiver.Listen(error), "Receiver should listen.");

    nvlink::net::NvlSender sender({
        .target_address = "127.0.0.1",
        .target_port = receiver.LocalPort(),
        .delay_between_packets = std::chrono::milliseconds(1),
    });

    nvlink::schema::Value value = record->DefaultValue();
    value.items[0] = nvlink::schema::IntValue(-123456);
    for (std::size_t index = 0; index < value.items[1].items.size(); ++index) {
        value.items[1].items[index] = nvlink::schema::RealValue(static_cast<double>(index) * 0.5);
    }
    value.items[2] = nvlink::schema::StringValue("line 4 / press");
    value.items[3] = nvlink::schema::BoolValue(true);

    passed &= Expect(sender.Send(7, *record, value, error), "Record should send.");
    passed &= Expect(sender.DiagnosticsSnapshot().sent_packet_count == 2, "446 bytes should travel in two packets.");
    PollUntil(receiver, values, 1);
    passed &= Expect(values.size() == 1, "Receiver should deliver exactly one record.");
    passed &= Expect(!values.empty() && values[0] == value, "Received record should equal the sent record.");

    value.items[0] = nvlink::schema::IntValue(1);
    sender.SetNextCounter(65535);
    passed &= Expect(sender.Send(7, *record, value, error), "Record should send at counter 65535.");
    passed &= Expect(sender.Send(7, *record, value, error), "Record should send at counter 0.");
    PollUntil(receiver, values, 3);
    passed &= Expect(values.size() == 3, "Both messages around the counter wrap should arrive.");

    passed &= Expect(
        sender.Send(8, *nvlink::schema::iec::Dint(), nvlink::schema::IntValue(5), error),
        "Data for an unregistered list should still send.");
    for (int index = 0; index < 200 && receiver.DiagnosticsSnapshot().assembler.unregistered_list_count == 0; ++index) {
        if (receiver.Poll() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    passed &= Expect(values.size() == 3, "Unregistered list should not reach the handler.");
    passed &= Expect(
        !receiver.Assembler().HasEntry(8),
        "Unregistered list should leave no entry.");

    const nvlink::net::ReceiverDiagnosticsSnapshot diagnostics = receiver.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.received_datagram_count == 7, "Seven datagrams should arrive.");
    passed &= Expect(diagnostics.assembler.packet_loss_count == 0, "Loopback should lose nothing.");
    passed &= Expect(diagnostics.identity_mismatch_count == 0, "Sender should stamp the NVL identity.");

    receiver.Close();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] nvlink_nvl_loopback_tests\n";
    return 0;
}
