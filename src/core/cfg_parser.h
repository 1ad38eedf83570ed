#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace nvlink::core::cfg {

// One "key = value" assignment. Keys written under a "[section]" header are
// addressed as "section_key" through QualifiedKey().
struct KeyValueLine final {
    std::string section;
    std::string key;
    std::string value;
    int line_number = 0;

    std::string QualifiedKey() const;
};

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error);

bool ParseText(
    std::string_view text,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error);

std::string Trim(std::string_view text);

// Double-quoted, with \" and \\ escapes.
bool ParseQuotedString(std::string_view value, std::string& out_text);
bool ParseBool(std::string_view value, bool& out_value);
bool ParseInt(std::string_view value, int& out_value);

}  // namespace nvlink::core::cfg
