#include "net/nvl_sender.h"

#include "core/logger.h"
#include "net/udp_transport.h"
#include "protocol/packet_splitter.h"
#include "wire/packet_header.h"

#include <thread>
#include <utility>

namespace nvlink::net {
namespace {

constexpr const char* kLogModule = "nvl.sender";

}  // namespace

NvlSenderSettings ToSenderSettings(const core::NvlConfig& config) {
    return NvlSenderSettings{
        .target_address = config.sender_target_address,
        .target_port = static_cast<std::uint16_t>(config.sender_target_port),
        .delay_between_packets = std::chrono::milliseconds(config.sender_delay_between_packets_ms),
    };
}

NvlSender::NvlSender(NvlSenderSettings settings)
    : settings_(std::move(settings)),
      delay_function_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {}

const NvlSenderSettings& NvlSender::Settings() const {
    return settings_;
}

void NvlSender::SetDelayFunction(DelayFunction delay_function) {
    delay_function_ = std::move(delay_function);
}

void NvlSender::SetDatagramSendFunction(DatagramSendFunction send_function) {
    send_function_ = std::move(send_function);
}

bool NvlSender::Send(
    std::uint16_t list_id,
    const schema::ISchema& schema,
    const schema::Value& value,
    std::string& out_error) {
    wire::ByteBuffer raw_message;
    if (!schema.ConvertToBuffer(value, raw_message, out_error)) {
        out_error = "convert " + schema.TypeName() + " failed: " + out_error;
        ++diagnostics_.send_failure_count;
        return false;
    }
    if (raw_message.size() != schema.ByteLength()) {
        out_error = schema.TypeName() + " produced " + std::to_string(raw_message.size()) + " bytes, expected " +
            std::to_string(schema.ByteLength());
        ++diagnostics_.send_failure_count;
        return false;
    }

    return SendRaw(list_id, raw_message, schema.Elements(), out_error);
}

bool NvlSender::SendRaw(
    std::uint16_t list_id,
    wire::ByteSpan raw_message,
    const std::vector<schema::ElementLayout>& elements,
    std::string& out_error) {
    const std::uint16_t counter = next_counter_;
    next_counter_ = static_cast<std::uint16_t>(next_counter_ + 1);

    std::vector<wire::Packet> packets;
    if (!protocol::Split(list_id, counter, raw_message, elements, protocol::kMaxPayloadBytes, packets, out_error)) {
        ++diagnostics_.send_failure_count;
        return false;
    }

    UdpTransport transport;
    if (!transport.Open("0.0.0.0", 0, UdpOpenOptions{.reuse_address = false, .allow_broadcast = true}, out_error)) {
        out_error = "open send socket failed: " + out_error;
        core::Logger::Error(kLogModule, out_error);
        ++diagnostics_.send_failure_count;
        return false;
    }

    core::Logger::Info(
        kLogModule,
        "Sending list " + std::to_string(list_id) + " counter " + std::to_string(counter) + " to " +
            settings_.target_address + ":" + std::to_string(settings_.target_port) + " (" +
            std::to_string(packets.size()) + " packet(s)).");

    const UdpEndpoint target{
        .host = settings_.target_address,
        .port = settings_.target_port,
    };
    wire::ByteBuffer datagram;
    for (std::size_t index = 0; index < packets.size(); ++index) {
        if (index > 0 && settings_.delay_between_packets.count() > 0 && delay_function_) {
            delay_function_(settings_.delay_between_packets);
        }

        wire::EncodePacket(packets[index], datagram);
        core::Logger::Debug(kLogModule, "Packet " + wire::DescribePacketHeader(packets[index].header));
        if (core::Logger::IsEnabled(core::LogLevel::Trace)) {
            core::Logger::Trace(kLogModule, wire::FormatHex(datagram));
        }

        const bool sent = send_function_ ? send_function_(target, datagram, out_error)
                                         : transport.SendTo(target, datagram, out_error);
        if (!sent) {
            out_error = "send packet " + std::to_string(index + 1) + "/" + std::to_string(packets.size()) +
                " failed: " + out_error;
            core::Logger::Error(kLogModule, out_error);
            ++diagnostics_.send_failure_count;
            return false;
        }
        ++diagnostics_.sent_packet_count;
    }

    ++diagnostics_.sent_message_count;
    out_error.clear();
    return true;
}

std::uint16_t NvlSender::NextCounter() const {
    return next_counter_;
}

void NvlSender::SetNextCounter(std::uint16_t counter) {
    next_counter_ = counter;
}

SenderDiagnosticsSnapshot NvlSender::DiagnosticsSnapshot() const {
    return diagnostics_;
}

}  // namespace nvlink::net
