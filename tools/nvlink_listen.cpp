#include "core/config.h"
#include "core/logger.h"
#include "net/nvl_receiver.h"
#include "schema/iec_type.h"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

struct ListenOptions final {
    std::filesystem::path config_path;
    std::uint16_t list_id = 0;
    bool list_id_set = false;
    std::string type_declaration;
    std::uint16_t port = 0;
    bool port_overridden = false;
    std::string local_address;
    std::string log_level;
    std::uint64_t duration_ms = 0;
};

std::atomic_bool g_keep_running{true};

void OnSignal(int signal_code) {
    (void)signal_code;
    g_keep_running.store(false);
}

template <typename Integer>
bool ParseInteger(std::string_view text, Integer& out_value) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out_value);
    return ec == std::errc() && ptr == text.data() + text.size() && !text.empty();
}

bool ParseArguments(int argc, char** argv, ListenOptions& out_options, std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        auto read_value = [&](const char* key) -> std::string {
            if (index + 1 >= argc) {
                out_error = std::string("Missing value for option: ") + key;
                return {};
            }
            ++index;
            return argv[index];
        };

        if (arg == "--config") {
            const std::string value = read_value("--config");
            if (value.empty()) {
                return false;
            }
            out_options.config_path = value;
            continue;
        }

        if (arg == "--list-id") {
            const std::string value = read_value("--list-id");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.list_id)) {
                out_error = "Invalid --list-id value";
                return false;
            }
            out_options.list_id_set = true;
            continue;
        }

        if (arg == "--type") {
            out_options.type_declaration = read_value("--type");
            if (out_options.type_declaration.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--port") {
            const std::string value = read_value("--port");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.port)) {
                out_error = "Invalid --port value";
                return false;
            }
            out_options.port_overridden = true;
            continue;
        }

        if (arg == "--local-address") {
            out_options.local_address = read_value("--local-address");
            if (out_options.local_address.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--log-level") {
            out_options.log_level = read_value("--log-level");
            if (out_options.log_level.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--duration-ms") {
            const std::string value = read_value("--duration-ms");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.duration_ms)) {
                out_error = "Invalid --duration-ms value";
                return false;
            }
            continue;
        }

        out_error = "Unknown option: " + arg;
        return false;
    }

    if (!out_options.list_id_set) {
        out_error = "list id is required (--list-id <id>)";
        return false;
    }
    if (out_options.type_declaration.empty()) {
        out_error = "type is required (--type <declaration>)";
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  nvlink_listen --list-id <id> --type <declaration> [--config <path>] [--port <port>]\n"
        << "                [--local-address <ipv4>] [--log-level <level>] [--duration-ms <ms>]\n"
        << "\n"
        << "Examples:\n"
        << "  nvlink_listen --list-id 1 --type \"STRUCT(counter:DINT, temps:ARRAY[0..3] OF REAL)\"\n"
        << "  nvlink_listen --config nvlink.cfg --list-id 50 --type \"ARRAY[1..300] OF BYTE\" --log-level debug\n";
}

}  // namespace

int main(int argc, char** argv) {
    ListenOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }

    nvlink::core::NvlConfig config{};
    if (!options.config_path.empty()) {
        if (!nvlink::core::ConfigLoader::Load(options.config_path, config, error)) {
            std::cerr << "[ERROR] config load failed: " << error << '\n';
            return 1;
        }
    }
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }

    nvlink::core::LogLevel log_level = nvlink::core::LogLevel::Info;
    if (!nvlink::core::TryParseLogLevel(config.log_level, log_level)) {
        std::cerr << "[ERROR] unknown log level: " << config.log_level << '\n';
        return 1;
    }
    nvlink::core::Logger::SetMinLevel(log_level);

    std::shared_ptr<const nvlink::schema::IecType> type;
    if (!nvlink::schema::TryParseIecType(options.type_declaration, type, error)) {
        std::cerr << "[ERROR] invalid --type: " << error << '\n';
        return 1;
    }

    nvlink::net::NvlReceiverSettings settings = nvlink::net::ToReceiverSettings(config);
    if (options.port_overridden) {
        settings.listening_port = options.port;
    }
    if (!options.local_address.empty()) {
        settings.local_address = options.local_address;
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    nvlink::net::NvlReceiver receiver(settings);
    receiver.AddHandler(
        options.list_id,
        type,
        [](const nvlink::schema::Value& value, const nvlink::protocol::Listener& listener) {
            std::cout << "[list " << listener.list_id << "] " << nvlink::schema::FormatValue(value) << std::endl;
        });

    if (!receiver.Listen(error)) {
        std::cerr << "[ERROR] " << error << '\n';
        return 1;
    }

    nvlink::core::Logger::Info(
        "tool",
        "Waiting for list " + std::to_string(options.list_id) + " as " + type->TypeName() + " (" +
            std::to_string(type->ByteLength()) + " bytes).");

    const auto started_at = std::chrono::steady_clock::now();
    while (g_keep_running.load()) {
        if (options.duration_ms > 0 &&
            std::chrono::steady_clock::now() - started_at >= std::chrono::milliseconds(options.duration_ms)) {
            break;
        }

        if (receiver.Poll() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    const nvlink::net::ReceiverDiagnosticsSnapshot diagnostics = receiver.DiagnosticsSnapshot();
    nvlink::core::Logger::Info(
        "tool",
        "Stopped: datagrams=" + std::to_string(diagnostics.received_datagram_count) +
            ", delivered=" + std::to_string(diagnostics.assembler.delivered_message_count) +
            ", malformed=" + std::to_string(diagnostics.malformed_header_count) +
            ", packet_loss=" + std::to_string(diagnostics.assembler.packet_loss_count) +
            ", size_mismatch=" + std::to_string(diagnostics.assembler.size_mismatch_count) +
            ", socket_errors=" + std::to_string(diagnostics.socket_error_count));
    receiver.Close();
    return 0;
}
