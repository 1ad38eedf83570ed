#include "net/nvl_sender.h"
#include "net/udp_transport.h"
#include "schema/iec_type.h"
#include "wire/packet_header.h"

#include <chrono>
#include <cstdint>
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

std::vector<nvlink::wire::Packet> DrainPackets(nvlink::net::UdpTransport& transport, std::size_t expected_count) {
    std::vector<nvlink::wire::Packet> packets;
    nvlink::wire::ByteBuffer datagram;
    nvlink::net::UdpEndpoint sender{};
    std::string error;
    for (int index = 0; index < 500 && packets.size() < expected_count; ++index) {
        if (!transport.Receive(datagram, sender, error)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }

        nvlink::wire::Packet packet;
        if (nvlink::wire::TryDecodePacket(datagram, packet, error)) {
            packets.push_back(std::move(packet));
        }
    }
    return packets;
}

}  // namespace

int main() {
    bool passed = true;
    std::string error;

    nvlink::net::UdpTransport plc;
    passed &= Expect(plc.Open(0, error), "Loopback receiving socket should open.");

    const nvlink::net::NvlSenderSettings defaults{};
    passed &= Expect(defaults.target_address == "255.255.255.255", "Sender should target broadcast by default.");
    passed &= Expect(defaults.target_port == 1202, "Sender should target port 1202 by default.");
    passed &= Expect(
        defaults.delay_between_packets == std::chrono::milliseconds(5),
        "Sender should pause 5 ms between packets by default.");

    nvlink::net::NvlSender sender({
        .target_address = "127.0.0.1",
        .target_port = plc.LocalPort(),
        .delay_between_packets = std::chrono::milliseconds(5),
    });
    std::vector<std::chrono::milliseconds> delays;
    sender.SetDelayFunction([&delays](std::chrono::milliseconds delay) { delays.push_back(delay); });

    std::shared_ptr<const nvlink::schema::IecType> bytes_type;
    passed &= Expect(
        nvlink::schema::TryParseIecType("ARRAY[0..299] OF BYTE", bytes_type, error),
        "300-byte array type should parse.");
    nvlink::schema::Value bytes_value = bytes_type->DefaultValue();
    for (std::size_t index = 0; index < bytes_value.items.size(); ++index) {
        bytes_value.items[index] = nvlink::schema::UIntValue(index % 251);
    }

    passed &= Expect(sender.NextCounter() == 0, "First message should use counter 0.");
    passed &= Expect(sender.Send(50, *bytes_type, bytes_value, error), "300-byte value should send.");
    passed &= Expect(error.empty(), "Successful send should not return error.");
    passed &= Expect(sender.NextCounter() == 1, "Counter should advance once per message.");
    passed &= Expect(
        delays.size() == 1 && delays[0] == std::chrono::milliseconds(5),
        "Delay should run once, between the two packets only.");

    const std::vector<nvlink::wire::Packet> packets = DrainPackets(plc, 2);
    passed &= Expect(packets.size() == 2, "Two packets should arrive.");
    if (packets.size() == 2) {
        passed &= Expect(
            packets[0].header.sub_index == 0 && packets[1].header.sub_index == 1,
            "Packets should arrive in sub index order.");
        passed &= Expect(
            packets[0].header.counter == 0 && packets[1].header.counter == 0,
            "Both packets should carry counter 0.");
        passed &= Expect(
            packets[0].header.index == 50 && packets[0].header.identity == nvlink::wire::kNvlIdentity,
            "Packets should carry the list ID and NVL identity.");
        passed &= Expect(
            packets[0].payload.size() == 256 && packets[1].payload.size() == 44,
            "Payloads should split 256 + 44.");
        passed &= Expect(
            packets[1].payload.back() == static_cast<nvlink::wire::Byte>(299 % 251),
            "Last byte should be the last array element.");
        passed &= Expect(packets[0].header.flags == 0 && packets[0].header.checksum == 0, "Flags and checksum are 0.");
    }

    sender.SetNextCounter(65535);
    delays.clear();
    passed &= Expect(
        sender.Send(51, *nvlink::schema::iec::Int(), nvlink::schema::IntValue(-5), error),
        "Single INT should send.");
    passed &= Expect(delays.empty(), "A single packet should not wait.");
    passed &= Expect(sender.NextCounter() == 0, "Counter should wrap from 65535 to 0.");
    const std::vector<nvlink::wire::Packet> wrapped = DrainPackets(plc, 1);
    passed &= Expect(
        wrapped.size() == 1 && wrapped[0].header.counter == 65535 && wrapped[0].header.variable_count == 1,
        "Wrapped message should carry counter 65535.");
    passed &= Expect(
        wrapped.size() == 1 && wrapped[0].payload == nvlink::wire::ByteBuffer({0xFB, 0xFF}),
        "INT payload should be little-endian two's complement.");

    passed &= Expect(
        !sender.Send(51, *nvlink::schema::iec::Int(), nvlink::schema::StringValue("x"), error),
        "Value that does not convert should fail the send.");
    passed &= Expect(!error.empty(), "Conversion failure should return readable error.");

    passed &= Expect(
        sender.SendRaw(52, nvlink::wire::ByteBuffer{}, {}, error),
        "Empty raw message should send a header-only packet.");
    const std::vector<nvlink::wire::Packet> header_only = DrainPackets(plc, 1);
    passed &= Expect(
        header_only.size() == 1 && header_only[0].payload.empty() && header_only[0].header.packet_length == 20,
        "Header-only packet should arrive.");

    nvlink::net::NvlSender broken_sender({
        .target_address = "not-an-ipv4-host",
        .target_port = plc.LocalPort(),
        .delay_between_packets = std::chrono::milliseconds(0),
    });
    passed &= Expect(
        !broken_sender.Send(53, *nvlink::schema::iec::Byte(), nvlink::schema::UIntValue(1), error),
        "Unreachable target should fail the send.");
    passed &= Expect(!error.empty(), "Transport failure should return readable error.");
    passed &= Expect(broken_sender.NextCounter() == 1, "Failed send should still consume its counter.");

    nvlink::net::NvlSender flaky_sender({
        .target_address = "127.0.0.1",
        .target_port = plc.LocalPort(),
        .delay_between_packets = std::chrono::milliseconds(0),
    });
    std::vector<std::uint16_t> written_sub_indices;
    flaky_sender.SetDatagramSendFunction(
        [&written_sub_indices](
            const nvlink::net::UdpEndpoint& target,
            nvlink::wire::ByteSpan datagram,
            std::string& out_error) {
            (void)target;
            nvlink::wire::PacketHeader header;
            if (!nvlink::wire::TryDecodePacketHeader(datagram, header, out_error)) {
                return false;
            }
            written_sub_indices.push_back(header.sub_index);
            if (header.sub_index == 1) {
                out_error = "network unreachable";
                return false;
            }
            return true;
        });
    const nvlink::wire::ByteBuffer three_packet_message(600, 0x5A);
    const std::vector<nvlink::schema::ElementLayout> three_packet_elements = {
        {.start_index = 0, .byte_length = 200, .name = "a"},
        {.start_index = 200, .byte_length = 200, .name = "b"},
        {.start_index = 400, .byte_length = 200, .name = "c"},
    };
    passed &= Expect(
        !flaky_sender.SendRaw(54, three_packet_message, three_packet_elements, error),
        "Failure on the second packet should fail the whole message.");
    passed &= Expect(error.find("2/3") != std::string::npos, "Error should name the failing packet.");
    passed &= Expect(
        written_sub_indices == std::vector<std::uint16_t>({0, 1}),
        "Third packet should never be handed to the socket.");
    const nvlink::net::SenderDiagnosticsSnapshot flaky_diagnostics = flaky_sender.DiagnosticsSnapshot();
    passed &= Expect(flaky_diagnostics.sent_packet_count == 1, "Only the first packet should count as sent.");
    passed &= Expect(flaky_diagnostics.send_failure_count == 1, "Aborted message should count one failure.");
    passed &= Expect(flaky_diagnostics.sent_message_count == 0, "Aborted message should not count as sent.");
    passed &= Expect(flaky_sender.NextCounter() == 1, "Aborted message should still consume its counter.");

    const nvlink::net::SenderDiagnosticsSnapshot diagnostics = sender.DiagnosticsSnapshot();
    passed &= Expect(diagnostics.sent_message_count == 3, "Three messages should be counted.");
    passed &= Expect(diagnostics.sent_packet_count == 4, "Four packets should be counted.");
    passed &= Expect(diagnostics.send_failure_count == 1, "Conversion failure should be counted.");
    passed &= Expect(
        broken_sender.DiagnosticsSnapshot().send_failure_count == 1,
        "Transport failure should be counted.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] nvlink_nvl_sender_tests\n";
    return 0;
}
