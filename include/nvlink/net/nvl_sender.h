#pragma once

#include "core/config.h"
#include "net/udp_transport.h"
#include "schema/schema.h"
#include "wire/byte_io.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace nvlink::net {

struct NvlSenderSettings final {
    std::string target_address = "255.255.255.255";
    std::uint16_t target_port = static_cast<std::uint16_t>(core::kDefaultNvlPort);
    std::chrono::milliseconds delay_between_packets{5};
};

NvlSenderSettings ToSenderSettings(const core::NvlConfig& config);

struct SenderDiagnosticsSnapshot final {
    std::uint64_t sent_message_count = 0;
    std::uint64_t sent_packet_count = 0;
    std::uint64_t send_failure_count = 0;
};

// Broadcasts NVL messages, one blocking call per message. Not thread-safe.
class NvlSender final {
public:
    using DelayFunction = std::function<void(std::chrono::milliseconds)>;
    using DatagramSendFunction =
        std::function<bool(const UdpEndpoint& target, wire::ByteSpan datagram, std::string& out_error)>;

    explicit NvlSender(NvlSenderSettings settings = {});

    const NvlSenderSettings& Settings() const;

    // Replaces the pause between packets; the default sleeps the calling thread.
    void SetDelayFunction(DelayFunction delay_function);
    // Replaces the per-datagram write; empty writes through the message's own socket.
    void SetDatagramSendFunction(DatagramSendFunction send_function);

    bool Send(
        std::uint16_t list_id,
        const schema::ISchema& schema,
        const schema::Value& value,
        std::string& out_error);
    bool SendRaw(
        std::uint16_t list_id,
        wire::ByteSpan raw_message,
        const std::vector<schema::ElementLayout>& elements,
        std::string& out_error);

    // Counter the next message will carry.
    std::uint16_t NextCounter() const;
    void SetNextCounter(std::uint16_t counter);

    SenderDiagnosticsSnapshot DiagnosticsSnapshot() const;

private:
    NvlSenderSettings settings_;
    DelayFunction delay_function_;
    DatagramSendFunction send_function_;
    std::uint16_t next_counter_ = 0;
    SenderDiagnosticsSnapshot diagnostics_{};
};

}  // namespace nvlink::net
