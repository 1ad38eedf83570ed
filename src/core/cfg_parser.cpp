#include "core/cfg_parser.h"

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <utility>

namespace nvlink::core::cfg {
namespace {

bool IsSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsNameChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '.' || ch == '-';
}

// Drops a trailing '#' comment that sits outside any quoted string.
std::string_view StripComment(std::string_view line) {
    bool in_quotes = false;
    for (std::size_t index = 0; index < line.size(); ++index) {
        const char ch = line[index];
        if (in_quotes && ch == '\\') {
            ++index;
            continue;
        }
        if (ch == '"') {
            in_quotes = !in_quotes;
        } else if (ch == '#' && !in_quotes) {
            return line.substr(0, index);
        }
    }
    return line;
}

bool IsValidName(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    for (const char ch : name) {
        if (!IsNameChar(ch)) {
            return false;
        }
    }
    return true;
}

std::string LineSuffix(int line_number) {
    return ": line " + std::to_string(line_number);
}

bool ParseStream(std::istream& stream, std::vector<KeyValueLine>& out_lines, std::string& out_error) {
    std::vector<KeyValueLine> parsed_lines;
    std::string section;
    std::string raw_line;
    int line_number = 0;
    while (std::getline(stream, raw_line)) {
        ++line_number;
        const std::string line = Trim(StripComment(raw_line));
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                out_error = "Invalid section header (missing ']')" + LineSuffix(line_number);
                return false;
            }
            section = Trim(std::string_view(line).substr(1, line.size() - 2));
            if (!section.empty() && !IsValidName(section)) {
                out_error = "Invalid section name '" + section + "'" + LineSuffix(line_number);
                return false;
            }
            continue;
        }

        const std::string::size_type equal_pos = line.find('=');
        if (equal_pos == std::string::npos) {
            out_error = "Invalid config line (missing '=')" + LineSuffix(line_number);
            return false;
        }

        KeyValueLine parsed{};
        parsed.section = section;
        parsed.key = Trim(std::string_view(line).substr(0, equal_pos));
        parsed.value = Trim(std::string_view(line).substr(equal_pos + 1));
        parsed.line_number = line_number;
        if (!IsValidName(parsed.key)) {
            out_error = "Invalid config key '" + parsed.key + "'" + LineSuffix(line_number);
            return false;
        }

        parsed_lines.push_back(std::move(parsed));
    }

    out_lines = std::move(parsed_lines);
    out_error.clear();
    return true;
}

}  // namespace

std::string KeyValueLine::QualifiedKey() const {
    return section.empty() ? key : section + "_" + key;
}

bool ParseFile(
    const std::filesystem::path& file_path,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        out_error = "Cannot open config file: " + file_path.string();
        return false;
    }

    return ParseStream(file, out_lines, out_error);
}

bool ParseText(
    std::string_view text,
    std::vector<KeyValueLine>& out_lines,
    std::string& out_error) {
    std::istringstream stream{std::string(text)};
    return ParseStream(stream, out_lines, out_error);
}

std::string Trim(std::string_view text) {
    while (!text.empty() && IsSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && IsSpace(text.back())) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

bool ParseQuotedString(std::string_view value, std::string& out_text) {
    const std::string trimmed = Trim(value);
    if (trimmed.size() < 2 || trimmed.front() != '"' || trimmed.back() != '"') {
        return false;
    }

    std::string text;
    for (std::size_t index = 1; index + 1 < trimmed.size(); ++index) {
        char ch = trimmed[index];
        if (ch == '\\') {
            if (index + 2 >= trimmed.size()) {
                return false;
            }
            ch = trimmed[++index];
        } else if (ch == '"') {
            return false;
        }
        text.push_back(ch);
    }

    out_text = std::move(text);
    return true;
}

bool ParseBool(std::string_view value, bool& out_value) {
    const std::string trimmed = Trim(value);
    if (trimmed == "true" || trimmed == "1") {
        out_value = true;
        return true;
    }
    if (trimmed == "false" || trimmed == "0") {
        out_value = false;
        return true;
    }
    return false;
}

bool ParseInt(std::string_view value, int& out_value) {
    const std::string trimmed = Trim(value);
    int parsed = 0;
    const char* end = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(trimmed.data(), end, parsed);
    if (trimmed.empty() || ec != std::errc() || ptr != end) {
        return false;
    }

    out_value = parsed;
    return true;
}

}  // namespace nvlink::core::cfg
