#pragma once

#include "wire/byte_io.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace nvlink::net {

struct UdpEndpoint final {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;
};

struct UdpOpenOptions final {
    bool reuse_address = false;
    bool allow_broadcast = false;
};

// Non-blocking IPv4 datagram socket.
class UdpTransport final {
public:
    static constexpr std::size_t kMaxDatagramSize = 65535;

    UdpTransport();
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    // "0.0.0.0" binds all interfaces.
    bool Open(
        std::string_view local_host,
        std::uint16_t local_port,
        const UdpOpenOptions& options,
        std::string& out_error);
    bool Open(std::uint16_t local_port, std::string& out_error);
    void Close();

    bool IsOpen() const;
    std::uint16_t LocalPort() const;

    bool SendTo(const UdpEndpoint& endpoint, wire::ByteSpan payload, std::string& out_error);

    // Returns false with an empty error when no datagram is pending.
    bool Receive(wire::ByteBuffer& out_payload, UdpEndpoint& out_sender, std::string& out_error);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nvlink::net
