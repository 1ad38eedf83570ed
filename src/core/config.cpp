#include "core/config.h"

#include "core/cfg_parser.h"
#include "core/logger.h"

#include <string>
#include <vector>

namespace nvlink::core {
namespace {

bool ParsePort(const std::string& value, int min_port, int& out_port) {
    int parsed_port = 0;
    if (!cfg::ParseInt(value, parsed_port)) {
        return false;
    }

    if (parsed_port < min_port || parsed_port > 65535) {
        return false;
    }

    out_port = parsed_port;
    return true;
}

bool ApplyLines(
    const std::vector<cfg::KeyValueLine>& lines,
    NvlConfig& out_config,
    std::string& out_error) {
    NvlConfig config = out_config;

    for (const cfg::KeyValueLine& line : lines) {
        const std::string key = line.QualifiedKey();
        const std::string line_suffix = ": line " + std::to_string(line.line_number);

        if (key == "receiver_listening_port") {
            if (!ParsePort(line.value, 0, config.receiver_listening_port)) {
                out_error = "receiver_listening_port expects integer within [0,65535]" + line_suffix;
                return false;
            }
            continue;
        }

        if (key == "receiver_local_address") {
            if (!cfg::ParseQuotedString(line.value, config.receiver_local_address)) {
                out_error = "receiver_local_address expects string" + line_suffix;
                return false;
            }
            continue;
        }

        if (key == "receiver_require_identity_match") {
            if (!cfg::ParseBool(line.value, config.receiver_require_identity_match)) {
                out_error = "receiver_require_identity_match expects boolean" + line_suffix;
                return false;
            }
            continue;
        }

        if (key == "sender_target_address") {
            if (!cfg::ParseQuotedString(line.value, config.sender_target_address)) {
                out_error = "sender_target_address expects string" + line_suffix;
                return false;
            }
            continue;
        }

        if (key == "sender_target_port") {
            if (!ParsePort(line.value, 1, config.sender_target_port)) {
                out_error = "sender_target_port expects integer within [1,65535]" + line_suffix;
                return false;
            }
            continue;
        }

        if (key == "sender_delay_between_packets_ms") {
            int delay_ms = 0;
            if (!cfg::ParseInt(line.value, delay_ms) || delay_ms < 0) {
                out_error = "sender_delay_between_packets_ms expects non-negative integer" + line_suffix;
                return false;
            }
            config.sender_delay_between_packets_ms = delay_ms;
            continue;
        }

        if (key == "log_level") {
            std::string level_text;
            LogLevel level = LogLevel::Info;
            if (!cfg::ParseQuotedString(line.value, level_text) || !TryParseLogLevel(level_text, level)) {
                out_error =
                    "log_level expects one of \"trace\"|\"debug\"|\"info\"|\"warn\"|\"error\"" + line_suffix;
                return false;
            }
            config.log_level = level_text;
            continue;
        }

        Logger::Debug("config", "Ignoring unknown key '" + key + "'" + line_suffix);
    }

    out_config = config;
    out_error.clear();
    return true;
}

}  // namespace

bool ConfigLoader::Load(
    const std::filesystem::path& file_path,
    NvlConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }

    return ApplyLines(lines, out_config, out_error);
}

bool ConfigLoader::LoadFromText(
    std::string_view text,
    NvlConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseText(text, lines, out_error)) {
        return false;
    }

    return ApplyLines(lines, out_config, out_error);
}

}  // namespace nvlink::core
