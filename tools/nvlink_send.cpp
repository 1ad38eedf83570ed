#include "core/config.h"
#include "core/logger.h"
#include "net/nvl_sender.h"
#include "schema/iec_type.h"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

struct SendOptions final {
    std::filesystem::path config_path;
    std::uint16_t list_id = 0;
    bool list_id_set = false;
    std::string type_declaration;
    std::string value_text;
    std::string target;
    std::uint16_t port = 0;
    bool port_overridden = false;
    int delay_ms = 0;
    bool delay_overridden = false;
    std::uint64_t repeat = 1;
    std::uint64_t interval_ms = 1000;
    std::string log_level;
};

template <typename Integer>
bool ParseInteger(std::string_view text, Integer& out_value) {
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out_value);
    return ec == std::errc() && ptr == text.data() + text.size() && !text.empty();
}

bool ParseArguments(int argc, char** argv, SendOptions& out_options, std::string& out_error) {
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

        if (arg == "--value") {
            out_options.value_text = read_value("--value");
            if (out_options.value_text.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--target") {
            out_options.target = read_value("--target");
            if (out_options.target.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--port") {
            const std::string value = read_value("--port");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.port) || out_options.port == 0) {
                out_error = "Invalid --port value";
                return false;
            }
            out_options.port_overridden = true;
            continue;
        }

        if (arg == "--delay-ms") {
            const std::string value = read_value("--delay-ms");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.delay_ms) || out_options.delay_ms < 0) {
                out_error = "Invalid --delay-ms value";
                return false;
            }
            out_options.delay_overridden = true;
            continue;
        }

        if (arg == "--repeat") {
            const std::string value = read_value("--repeat");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.repeat) || out_options.repeat == 0) {
                out_error = "Invalid --repeat value";
                return false;
            }
            continue;
        }

        if (arg == "--interval-ms") {
            const std::string value = read_value("--interval-ms");
            if (value.empty()) {
                return false;
            }
            if (!ParseInteger(value, out_options.interval_ms)) {
                out_error = "Invalid --interval-ms value";
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
    if (out_options.value_text.empty()) {
        out_error = "value is required (--value <text>)";
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  nvlink_send --list-id <id> --type <declaration> --value <text> [--config <path>]\n"
        << "              [--target <ipv4>] [--port <port>] [--delay-ms <ms>] [--repeat <count>]\n"
        << "              [--interval-ms <ms>] [--log-level <level>]\n"
        << "\n"
        << "Examples:\n"
        << "  nvlink_send --list-id 1 --type \"STRUCT(counter:DINT, name:STRING(16))\" "
        << "--value \"{counter=42, name=\\\"pump\\\"}\"\n"
        << "  nvlink_send --target 127.0.0.1 --list-id 7 --type \"ARRAY[0..3] OF INT\" --value \"[1, 2, 3, 4]\"\n";
}

}  // namespace

int main(int argc, char** argv) {
    SendOptions options{};
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

    nvlink::schema::Value value;
    if (!nvlink::schema::TryParseIecValue(options.value_text, *type, value, error)) {
        std::cerr << "[ERROR] invalid --value: " << error << '\n';
        return 1;
    }

    nvlink::net::NvlSenderSettings settings = nvlink::net::ToSenderSettings(config);
    if (!options.target.empty()) {
        settings.target_address = options.target;
    }
    if (options.port_overridden) {
        settings.target_port = options.port;
    }
    if (options.delay_overridden) {
        settings.delay_between_packets = std::chrono::milliseconds(options.delay_ms);
    }

    nvlink::net::NvlSender sender(settings);
    for (std::uint64_t round = 0; round < options.repeat; ++round) {
        if (round > 0 && options.interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options.interval_ms));
        }

        if (!sender.Send(options.list_id, *type, value, error)) {
            std::cerr << "[ERROR] send failed: " << error << '\n';
            return 1;
        }
    }

    const nvlink::net::SenderDiagnosticsSnapshot diagnostics = sender.DiagnosticsSnapshot();
    nvlink::core::Logger::Info(
        "tool",
        "Sent " + std::to_string(diagnostics.sent_message_count) + " message(s) in " +
            std::to_string(diagnostics.sent_packet_count) + " packet(s) to " + settings.target_address + ":" +
            std::to_string(settings.target_port) + ".");
    return 0;
}
