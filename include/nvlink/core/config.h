#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace nvlink::core {

inline constexpr int kDefaultNvlPort = 1202;

struct NvlConfig final {
    int receiver_listening_port = kDefaultNvlPort;
    std::string receiver_local_address = "0.0.0.0";
    bool receiver_require_identity_match = false;
    std::string sender_target_address = "255.255.255.255";
    int sender_target_port = kDefaultNvlPort;
    int sender_delay_between_packets_ms = 5;
    std::string log_level = "info";
};

class ConfigLoader final {
public:
    static bool Load(
        const std::filesystem::path& file_path,
        NvlConfig& out_config,
        std::string& out_error);
    static bool LoadFromText(
        std::string_view text,
        NvlConfig& out_config,
        std::string& out_error);
};

}  // namespace nvlink::core
