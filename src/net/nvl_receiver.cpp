#include "net/nvl_receiver.h"

#include "core/logger.h"
#include "wire/packet_header.h"

#include <algorithm>
#include <utility>

namespace nvlink::net {
namespace {

constexpr const char* kLogModule = "nvl.receiver";

bool HasNvlIdentity(wire::ByteSpan datagram) {
    return datagram.size() >= wire::kNvlIdentity.size() &&
        std::equal(wire::kNvlIdentity.begin(), wire::kNvlIdentity.end(), datagram.begin());
}

}  // namespace

NvlReceiverSettings ToReceiverSettings(const core::NvlConfig& config) {
    return NvlReceiverSettings{
        .listening_port = static_cast<std::uint16_t>(config.receiver_listening_port),
        .local_address = config.receiver_local_address,
        .require_identity_match = config.receiver_require_identity_match,
    };
}

NvlReceiver::NvlReceiver(NvlReceiverSettings settings)
    : settings_(std::move(settings)), assembler_(registry_) {}

NvlReceiver::~NvlReceiver() {
    Close();
}

const NvlReceiverSettings& NvlReceiver::Settings() const {
    return settings_;
}

bool NvlReceiver::Listen(std::string& out_error) {
    if (transport_.IsOpen()) {
        out_error = "receiver is already listening on port " + std::to_string(transport_.LocalPort());
        return false;
    }

    const UdpOpenOptions options{
        .reuse_address = true,
        .allow_broadcast = true,
    };
    if (!transport_.Open(settings_.local_address, settings_.listening_port, options, out_error)) {
        out_error = "bind " + settings_.local_address + ":" + std::to_string(settings_.listening_port) +
            " failed: " + out_error;
        core::Logger::Error(kLogModule, out_error);
        return false;
    }

    core::Logger::Info(
        kLogModule,
        "Listening on " + settings_.local_address + ":" + std::to_string(transport_.LocalPort()) + ".");
    out_error.clear();
    return true;
}

void NvlReceiver::Close() {
    const bool was_listening = transport_.IsOpen();
    transport_.Close();
    registry_.Clear();
    assembler_.Clear();
    if (was_listening) {
        core::Logger::Info(kLogModule, "Closed.");
    }
}

bool NvlReceiver::IsListening() const {
    return transport_.IsOpen();
}

std::uint16_t NvlReceiver::LocalPort() const {
    return transport_.LocalPort();
}

protocol::ListenerHandle NvlReceiver::AddHandler(
    std::uint16_t list_id,
    std::shared_ptr<const schema::ISchema> schema,
    protocol::ValueCallback callback) {
    if (schema == nullptr) {
        core::Logger::Warn(kLogModule, "Ignoring handler without schema for list " + std::to_string(list_id) + ".");
        return protocol::kInvalidListenerHandle;
    }

    core::Logger::Debug(
        kLogModule,
        "Handler for list " + std::to_string(list_id) + " (" + schema->TypeName() + ", " +
            std::to_string(schema->ByteLength()) + " bytes).");
    return registry_.Register(list_id, std::move(schema), std::move(callback));
}

protocol::ListenerHandle NvlReceiver::AddRawHandler(
    std::uint16_t list_id,
    std::size_t expected_byte_length,
    protocol::RawCallback callback) {
    return registry_.Register(list_id, expected_byte_length, std::move(callback));
}

bool NvlReceiver::RemoveHandler(protocol::ListenerHandle handle) {
    return registry_.Unregister(handle);
}

void NvlReceiver::RemoveAllHandlers() {
    registry_.Clear();
}

std::size_t NvlReceiver::HandlerCount() const {
    return registry_.Size();
}

std::size_t NvlReceiver::Poll(std::size_t max_datagrams) {
    std::size_t handled_count = 0;
    if (!transport_.IsOpen()) {
        return handled_count;
    }

    wire::ByteBuffer datagram;
    UdpEndpoint sender{};
    std::string error;
    // A handler may Close() the receiver mid-round.
    while (handled_count < max_datagrams && transport_.IsOpen()) {
        if (!transport_.Receive(datagram, sender, error)) {
            if (!error.empty()) {
                core::Logger::Warn(kLogModule, "Socket error: " + error);
                ++diagnostics_.socket_error_count;
            }
            break;
        }

        core::Logger::Debug(
            kLogModule,
            "Datagram of " + std::to_string(datagram.size()) + " bytes from " + sender.host + ":" +
                std::to_string(sender.port) + ".");
        HandleDatagram(datagram);
        ++handled_count;
    }

    return handled_count;
}

void NvlReceiver::HandleDatagram(wire::ByteSpan datagram) {
    ++diagnostics_.received_datagram_count;
    if (core::Logger::IsEnabled(core::LogLevel::Trace)) {
        core::Logger::Trace(kLogModule, wire::FormatHex(datagram));
    }

    wire::Packet packet;
    std::string error;
    if (!wire::TryDecodePacket(datagram, packet, error)) {
        core::Logger::Debug(kLogModule, "Dropped datagram, " + error);
        ++diagnostics_.malformed_header_count;
        return;
    }

    if (settings_.require_identity_match && !HasNvlIdentity(datagram)) {
        core::Logger::Debug(kLogModule, "Dropped datagram without NVL identity.");
        ++diagnostics_.identity_mismatch_count;
        return;
    }

    core::Logger::Debug(kLogModule, "Packet " + wire::DescribePacketHeader(packet.header));
    const protocol::IngestResult result = assembler_.Ingest(packet);
    if (result == protocol::IngestResult::Delivered) {
        core::Logger::Info(
            kLogModule,
            "Delivered list " + std::to_string(packet.header.index) + " counter " +
                std::to_string(packet.header.counter) + ".");
    }
}

const protocol::FragmentAssembler& NvlReceiver::Assembler() const {
    return assembler_;
}

ReceiverDiagnosticsSnapshot NvlReceiver::DiagnosticsSnapshot() const {
    ReceiverDiagnosticsSnapshot snapshot = diagnostics_;
    snapshot.assembler = assembler_.DiagnosticsSnapshot();
    return snapshot;
}

}  // namespace nvlink::net
