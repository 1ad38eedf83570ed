#include "net/udp_transport.h"

#include <cstring>
#include <string>
#include <utility>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#endif

namespace nvlink::net {
namespace {

#if defined(_WIN32)
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidSocket = INVALID_SOCKET;
using SocketLength = int;
#else
using NativeSocket = int;
constexpr NativeSocket kInvalidSocket = -1;
using SocketLength = socklen_t;
#endif

int LastSocketError() {
#if defined(_WIN32)
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string SocketErrorText(std::string_view what, int error_code) {
#if defined(_WIN32)
    return std::string(what) + ", code=" + std::to_string(error_code);
#else
    return std::string(what) + ": " + std::strerror(error_code);
#endif
}

bool IsWouldBlock(int error_code) {
#if defined(_WIN32)
    // WSAECONNRESET reports an ICMP port-unreachable for an earlier send.
    return error_code == WSAEWOULDBLOCK || error_code == WSAECONNRESET;
#else
    return error_code == EWOULDBLOCK || error_code == EAGAIN;
#endif
}

// Holds one Winsock reference for as long as a socket is open; no-op elsewhere.
class SocketSubsystem final {
public:
    SocketSubsystem() = default;
    SocketSubsystem(const SocketSubsystem&) = delete;
    SocketSubsystem& operator=(const SocketSubsystem&) = delete;

    ~SocketSubsystem() {
        Release();
    }

    bool Acquire(std::string& out_error) {
#if defined(_WIN32)
        if (acquired_) {
            return true;
        }
        WSADATA wsa_data{};
        const int startup_result = WSAStartup(MAKEWORD(2, 2), &wsa_data);
        if (startup_result != 0) {
            out_error = "WSAStartup failed, code=" + std::to_string(startup_result);
            return false;
        }
        acquired_ = true;
#else
        (void)out_error;
#endif
        return true;
    }

    void Release() {
#if defined(_WIN32)
        if (acquired_) {
            WSACleanup();
            acquired_ = false;
        }
#endif
    }

private:
#if defined(_WIN32)
    bool acquired_ = false;
#endif
};

class ScopedSocket final {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(NativeSocket handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : handle_(std::exchange(other.handle_, kInvalidSocket)) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            Reset();
            handle_ = std::exchange(other.handle_, kInvalidSocket);
        }
        return *this;
    }

    ~ScopedSocket() {
        Reset();
    }

    NativeSocket Get() const {
        return handle_;
    }

    bool IsValid() const {
        return handle_ != kInvalidSocket;
    }

    void Reset() {
        if (handle_ == kInvalidSocket) {
            return;
        }
#if defined(_WIN32)
        closesocket(handle_);
#else
        close(handle_);
#endif
        handle_ = kInvalidSocket;
    }

private:
    NativeSocket handle_ = kInvalidSocket;
};

bool MakeNonBlocking(NativeSocket handle, std::string& out_error) {
#if defined(_WIN32)
    u_long mode = 1;
    if (ioctlsocket(handle, FIONBIO, &mode) != 0) {
        out_error = SocketErrorText("ioctlsocket(FIONBIO) failed", LastSocketError());
        return false;
    }
#else
    const int flags = fcntl(handle, F_GETFL, 0);
    if (flags < 0 || fcntl(handle, F_SETFL, flags | O_NONBLOCK) < 0) {
        out_error = SocketErrorText("fcntl(O_NONBLOCK) failed", LastSocketError());
        return false;
    }
#endif
    return true;
}

bool EnableOption(NativeSocket handle, int option, const char* option_name, std::string& out_error) {
    const int enabled = 1;
    const int result = setsockopt(
        handle,
        SOL_SOCKET,
        option,
        reinterpret_cast<const char*>(&enabled),
        sizeof(enabled));
    if (result != 0) {
        out_error = SocketErrorText(std::string("setsockopt(") + option_name + ") failed", LastSocketError());
        return false;
    }
    return true;
}

// Empty host and "0.0.0.0" both mean every local interface.
bool ToSocketAddress(
    std::string_view host,
    std::uint16_t port,
    sockaddr_in& out_address,
    std::string& out_error) {
    std::memset(&out_address, 0, sizeof(out_address));
    out_address.sin_family = AF_INET;
    out_address.sin_port = htons(port);

    if (host.empty() || host == "0.0.0.0") {
        out_address.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }

    const std::string host_text(host);
    if (inet_pton(AF_INET, host_text.c_str(), &out_address.sin_addr) != 1) {
        out_error = "invalid IPv4 host: " + host_text;
        return false;
    }
    return true;
}

UdpEndpoint ToEndpoint(const sockaddr_in& address) {
    char text[INET_ADDRSTRLEN] = {};
    UdpEndpoint endpoint;
    endpoint.host = inet_ntop(AF_INET, &address.sin_addr, text, INET_ADDRSTRLEN) != nullptr ? text : "0.0.0.0";
    endpoint.port = ntohs(address.sin_port);
    return endpoint;
}

std::string DescribeBind(std::string_view host, std::uint16_t port) {
    return "bind to " + std::string(host.empty() ? std::string_view("0.0.0.0") : host) + ":" +
        std::to_string(port) + " failed";
}

}  // namespace

struct UdpTransport::Impl final {
    // Declared first so the socket closes before the subsystem is released.
    SocketSubsystem subsystem;
    ScopedSocket socket;
    std::uint16_t local_port = 0;
    wire::ByteBuffer receive_buffer;
};

UdpTransport::UdpTransport()
    : impl_(std::make_unique<Impl>()) {}

UdpTransport::~UdpTransport() {
    Close();
}

bool UdpTransport::Open(
    std::string_view local_host,
    std::uint16_t local_port,
    const UdpOpenOptions& options,
    std::string& out_error) {
    Close();

    sockaddr_in bind_address{};
    if (!ToSocketAddress(local_host, local_port, bind_address, out_error)) {
        return false;
    }

    SocketSubsystem subsystem;
    if (!subsystem.Acquire(out_error)) {
        return false;
    }

    ScopedSocket socket(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!socket.IsValid()) {
        out_error = SocketErrorText("socket creation failed", LastSocketError());
        return false;
    }

    if (!MakeNonBlocking(socket.Get(), out_error) ||
        (options.reuse_address && !EnableOption(socket.Get(), SO_REUSEADDR, "SO_REUSEADDR", out_error)) ||
        (options.allow_broadcast && !EnableOption(socket.Get(), SO_BROADCAST, "SO_BROADCAST", out_error))) {
        return false;
    }

    if (bind(socket.Get(), reinterpret_cast<const sockaddr*>(&bind_address), sizeof(bind_address)) != 0) {
        out_error = SocketErrorText(DescribeBind(local_host, local_port), LastSocketError());
        return false;
    }

    sockaddr_in bound_address{};
    SocketLength bound_address_size = sizeof(bound_address);
    if (getsockname(socket.Get(), reinterpret_cast<sockaddr*>(&bound_address), &bound_address_size) != 0) {
        out_error = SocketErrorText("getsockname failed", LastSocketError());
        return false;
    }

    if (!impl_->subsystem.Acquire(out_error)) {
        return false;
    }
    impl_->socket = std::move(socket);
    impl_->local_port = ntohs(bound_address.sin_port);
    out_error.clear();
    return true;
}

bool UdpTransport::Open(std::uint16_t local_port, std::string& out_error) {
    return Open("127.0.0.1", local_port, UdpOpenOptions{}, out_error);
}

void UdpTransport::Close() {
    if (impl_ == nullptr) {
        return;
    }

    impl_->socket.Reset();
    impl_->subsystem.Release();
    impl_->local_port = 0;
}

bool UdpTransport::IsOpen() const {
    return impl_ != nullptr && impl_->socket.IsValid();
}

std::uint16_t UdpTransport::LocalPort() const {
    return impl_ != nullptr ? impl_->local_port : 0;
}

bool UdpTransport::SendTo(
    const UdpEndpoint& endpoint,
    wire::ByteSpan payload,
    std::string& out_error) {
    if (!IsOpen()) {
        out_error = "transport is not open";
        return false;
    }
    if (endpoint.port == 0) {
        out_error = "endpoint port must be non-zero";
        return false;
    }

    sockaddr_in target{};
    if (endpoint.host.empty() || !ToSocketAddress(endpoint.host, endpoint.port, target, out_error)) {
        if (endpoint.host.empty()) {
            out_error = "endpoint host must not be empty";
        }
        return false;
    }

    const auto sent = sendto(
        impl_->socket.Get(),
        reinterpret_cast<const char*>(payload.data()),
        static_cast<int>(payload.size()),
        0,
        reinterpret_cast<const sockaddr*>(&target),
        sizeof(target));
    if (sent < 0) {
        out_error = SocketErrorText(
            "sendto " + endpoint.host + ":" + std::to_string(endpoint.port) + " failed",
            LastSocketError());
        return false;
    }
    if (static_cast<std::size_t>(sent) != payload.size()) {
        out_error = "sendto failed: partial datagram write";
        return false;
    }

    out_error.clear();
    return true;
}

bool UdpTransport::Receive(wire::ByteBuffer& out_payload, UdpEndpoint& out_sender, std::string& out_error) {
    if (!IsOpen()) {
        out_error = "transport is not open";
        return false;
    }

    impl_->receive_buffer.resize(kMaxDatagramSize);
    sockaddr_in source{};
    SocketLength source_size = sizeof(source);
    const auto received = recvfrom(
        impl_->socket.Get(),
        reinterpret_cast<char*>(impl_->receive_buffer.data()),
        static_cast<int>(impl_->receive_buffer.size()),
        0,
        reinterpret_cast<sockaddr*>(&source),
        &source_size);
    if (received < 0) {
        const int error_code = LastSocketError();
        if (IsWouldBlock(error_code)) {
            out_error.clear();
        } else {
            out_error = SocketErrorText("recvfrom failed", error_code);
        }
        return false;
    }

    out_payload.assign(
        impl_->receive_buffer.begin(),
        impl_->receive_buffer.begin() + static_cast<std::ptrdiff_t>(received));
    out_sender = ToEndpoint(source);
    out_error.clear();
    return true;
}

}  // namespace nvlink::net
