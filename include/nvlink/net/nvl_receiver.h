#pragma once

#include "core/config.h"
#include "net/udp_transport.h"
#include "protocol/fragment_assembler.h"
#include "protocol/listener_registry.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace nvlink::net {

struct NvlReceiverSettings final {
    std::uint16_t listening_port = static_cast<std::uint16_t>(core::kDefaultNvlPort);
    std::string local_address = "0.0.0.0";
    // Drop datagrams whose first four bytes are not the NVL identity.
    bool require_identity_match = false;
};

NvlReceiverSettings ToReceiverSettings(const core::NvlConfig& config);

struct ReceiverDiagnosticsSnapshot final {
    std::uint64_t received_datagram_count = 0;
    std::uint64_t malformed_header_count = 0;
    std::uint64_t identity_mismatch_count = 0;
    std::uint64_t socket_error_count = 0;
    protocol::AssemblerDiagnosticsSnapshot assembler{};
};

// Owns the receive socket, the listener registry and the fragment buffers.
// Single-threaded: call Poll from the thread that owns the receiver.
class NvlReceiver final {
public:
    static constexpr std::size_t kDefaultPollBudget = 64;

    explicit NvlReceiver(NvlReceiverSettings settings = {});
    ~NvlReceiver();

    NvlReceiver(const NvlReceiver&) = delete;
    NvlReceiver& operator=(const NvlReceiver&) = delete;

    const NvlReceiverSettings& Settings() const;

    bool Listen(std::string& out_error);
    // Releases the socket, removes every handler and drops pending fragments.
    void Close();
    bool IsListening() const;
    std::uint16_t LocalPort() const;

    protocol::ListenerHandle AddHandler(
        std::uint16_t list_id,
        std::shared_ptr<const schema::ISchema> schema,
        protocol::ValueCallback callback);
    protocol::ListenerHandle AddRawHandler(
        std::uint16_t list_id,
        std::size_t expected_byte_length,
        protocol::RawCallback callback);
    bool RemoveHandler(protocol::ListenerHandle handle);
    void RemoveAllHandlers();
    std::size_t HandlerCount() const;

    // Drains up to max_datagrams pending datagrams. Returns the number handled.
    std::size_t Poll(std::size_t max_datagrams = kDefaultPollBudget);
    void HandleDatagram(wire::ByteSpan datagram);

    const protocol::FragmentAssembler& Assembler() const;
    ReceiverDiagnosticsSnapshot DiagnosticsSnapshot() const;

private:
    NvlReceiverSettings settings_;
    UdpTransport transport_;
    protocol::ListenerRegistry registry_;
    protocol::FragmentAssembler assembler_;
    ReceiverDiagnosticsSnapshot diagnostics_{};
};

}  // namespace nvlink::net
