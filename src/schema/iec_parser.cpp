#include "schema/iec_type.h"

#include <cctype>
#include <charconv>
#include <utility>

namespace nvlink::schema {
namespace {

constexpr std::size_t kMaxNestingDepth = 32;

bool IsIdentifierChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

std::string ToUpper(std::string_view text) {
    std::string upper(text);
    for (char& ch : upper) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return upper;
}

class TextCursor final {
public:
    explicit TextCursor(std::string_view text) : text_(text) {}

    void SkipSpace() {
        while (offset_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[offset_])) != 0) {
            ++offset_;
        }
    }

    bool AtEnd() {
        SkipSpace();
        return offset_ >= text_.size();
    }

    char Peek() {
        SkipSpace();
        return offset_ < text_.size() ? text_[offset_] : '\0';
    }

    bool Consume(char expected) {
        if (Peek() != expected) {
            return false;
        }
        ++offset_;
        return true;
    }

    bool ConsumeLiteral(std::string_view literal) {
        SkipSpace();
        if (text_.substr(offset_, literal.size()) != literal) {
            return false;
        }
        offset_ += literal.size();
        return true;
    }

    std::string_view ReadIdentifier() {
        SkipSpace();
        const std::size_t start = offset_;
        while (offset_ < text_.size() && IsIdentifierChar(text_[offset_])) {
            ++offset_;
        }
        return text_.substr(start, offset_ - start);
    }

    // Longest run that can belong to a numeric literal.
    std::string_view ReadNumberToken() {
        SkipSpace();
        const std::size_t start = offset_;
        while (offset_ < text_.size()) {
            const char ch = text_[offset_];
            const bool exponent_sign = (ch == '+' || ch == '-') && offset_ > start &&
                (text_[offset_ - 1] == 'e' || text_[offset_ - 1] == 'E');
            const bool leading_sign = (ch == '+' || ch == '-') && offset_ == start;
            if (std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == 'e' || ch == 'E' ||
                exponent_sign || leading_sign) {
                ++offset_;
                continue;
            }
            // A '.' directly followed by another '.' is a range separator, not a decimal point.
            if (ch == '.' && (offset_ + 1 >= text_.size() || text_[offset_ + 1] != '.')) {
                ++offset_;
                continue;
            }
            break;
        }
        return text_.substr(start, offset_ - start);
    }

    bool ReadQuotedString(std::string& out_value, std::string& out_error) {
        if (Peek() != '"' && Peek() != '\'') {
            out_error = "expected quoted string at offset " + std::to_string(offset_);
            return false;
        }
        const char quote = text_[offset_++];
        std::string value;
        while (offset_ < text_.size()) {
            const char ch = text_[offset_++];
            if (ch == quote) {
                out_value = std::move(value);
                return true;
            }
            if (ch == '\\' && offset_ < text_.size()) {
                value.push_back(text_[offset_++]);
                continue;
            }
            value.push_back(ch);
        }
        out_error = "unterminated string";
        return false;
    }

    std::size_t Offset() const {
        return offset_;
    }

private:
    std::string_view text_;
    std::size_t offset_ = 0;
};

bool ParseSignedToken(std::string_view token, std::int64_t& out_value) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out_value);
    return ec == std::errc() && ptr == token.data() + token.size() && !token.empty();
}

bool ParseUnsignedToken(std::string_view token, std::uint64_t& out_value) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out_value);
    return ec == std::errc() && ptr == token.data() + token.size() && !token.empty();
}

bool ParseRealToken(std::string_view token, double& out_value) {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out_value);
    return ec == std::errc() && ptr == token.data() + token.size() && !token.empty();
}

bool ParseElementaryKind(const std::string& upper_name, IecKind& out_kind) {
    static constexpr IecKind kElementaryKinds[] = {
        IecKind::Bool,
        IecKind::Sint,
        IecKind::Usint,
        IecKind::Byte,
        IecKind::Int,
        IecKind::Uint,
        IecKind::Word,
        IecKind::Dint,
        IecKind::Udint,
        IecKind::Dword,
        IecKind::Lint,
        IecKind::Ulint,
        IecKind::Lword,
        IecKind::Real,
        IecKind::Lreal,
    };
    for (const IecKind kind : kElementaryKinds) {
        if (upper_name == IecKindName(kind)) {
            out_kind = kind;
            return true;
        }
    }
    return false;
}

bool ParseType(
    TextCursor& cursor,
    std::size_t depth,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error);

bool ParseStringType(TextCursor& cursor, std::shared_ptr<const IecType>& out_type, std::string& out_error) {
    char closing = '\0';
    if (cursor.Consume('(')) {
        closing = ')';
    } else if (cursor.Consume('[')) {
        closing = ']';
    } else {
        out_type = IecType::String(80);
        return true;
    }

    std::uint64_t max_length = 0;
    if (!ParseUnsignedToken(cursor.ReadNumberToken(), max_length) || max_length == 0 || max_length > 65535) {
        out_error = "invalid STRING length";
        return false;
    }
    if (!cursor.Consume(closing)) {
        out_error = std::string("expected '") + closing + "' after STRING length";
        return false;
    }
    out_type = IecType::String(static_cast<std::size_t>(max_length));
    return true;
}

bool ParseArrayType(
    TextCursor& cursor,
    std::size_t depth,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error) {
    if (!cursor.Consume('[')) {
        out_error = "expected '[' after ARRAY";
        return false;
    }

    std::int64_t lower_bound = 0;
    if (!ParseSignedToken(cursor.ReadNumberToken(), lower_bound)) {
        out_error = "invalid ARRAY lower bound";
        return false;
    }
    if (!cursor.ConsumeLiteral("..")) {
        out_error = "expected '..' in ARRAY bounds";
        return false;
    }
    std::int64_t upper_bound = 0;
    if (!ParseSignedToken(cursor.ReadNumberToken(), upper_bound)) {
        out_error = "invalid ARRAY upper bound";
        return false;
    }
    if (!cursor.Consume(']')) {
        out_error = "expected ']' after ARRAY bounds";
        return false;
    }
    if (lower_bound < INT32_MIN || upper_bound > INT32_MAX || upper_bound < lower_bound) {
        out_error = "ARRAY bounds out of range: " + std::to_string(lower_bound) + ".." +
            std::to_string(upper_bound);
        return false;
    }
    if (ToUpper(cursor.ReadIdentifier()) != "OF") {
        out_error = "expected OF after ARRAY bounds";
        return false;
    }

    std::shared_ptr<const IecType> element_type;
    if (!ParseType(cursor, depth + 1, element_type, out_error)) {
        return false;
    }
    out_type = IecType::Array(
        std::move(element_type),
        static_cast<std::int32_t>(lower_bound),
        static_cast<std::size_t>(upper_bound - lower_bound + 1));
    if (out_type == nullptr) {
        out_error = "ARRAY[" + std::to_string(lower_bound) + ".." + std::to_string(upper_bound) +
            "] byte length overflows";
        return false;
    }
    return true;
}

bool ParseStructType(
    TextCursor& cursor,
    std::size_t depth,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error) {
    if (!cursor.Consume('(')) {
        out_error = "expected '(' after STRUCT";
        return false;
    }

    std::vector<IecType::Member> members;
    while (!cursor.Consume(')')) {
        if (!members.empty() && !cursor.Consume(',') && !cursor.Consume(';')) {
            out_error = "expected ',' between STRUCT members";
            return false;
        }
        // Trailing separator before the closing parenthesis.
        if (cursor.Consume(')')) {
            break;
        }

        const std::string_view name = cursor.ReadIdentifier();
        if (name.empty()) {
            out_error = "expected member name at offset " + std::to_string(cursor.Offset());
            return false;
        }
        for (const IecType::Member& member : members) {
            if (member.name == name) {
                out_error = "duplicate STRUCT member '" + std::string(name) + "'";
                return false;
            }
        }
        if (!cursor.Consume(':')) {
            out_error = "expected ':' after member '" + std::string(name) + "'";
            return false;
        }

        std::shared_ptr<const IecType> member_type;
        if (!ParseType(cursor, depth + 1, member_type, out_error)) {
            return false;
        }
        members.push_back(IecType::Member{
            .name = std::string(name),
            .type = std::move(member_type),
        });
    }

    if (members.empty()) {
        out_error = "STRUCT has no members";
        return false;
    }
    out_type = IecType::Struct(std::move(members));
    if (out_type == nullptr) {
        out_error = "STRUCT byte length overflows";
        return false;
    }
    return true;
}

bool ParseType(
    TextCursor& cursor,
    std::size_t depth,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error) {
    if (depth > kMaxNestingDepth) {
        out_error = "type nesting too deep";
        return false;
    }

    const std::string keyword = ToUpper(cursor.ReadIdentifier());
    if (keyword.empty()) {
        out_error = "expected type name at offset " + std::to_string(cursor.Offset());
        return false;
    }

    IecKind kind = IecKind::Bool;
    if (ParseElementaryKind(keyword, kind)) {
        out_type = IecType::Elementary(kind);
        return true;
    }
    if (keyword == "STRING") {
        return ParseStringType(cursor, out_type, out_error);
    }
    if (keyword == "ARRAY") {
        return ParseArrayType(cursor, depth, out_type, out_error);
    }
    if (keyword == "STRUCT") {
        return ParseStructType(cursor, depth, out_type, out_error);
    }

    out_error = "unknown type '" + keyword + "'";
    return false;
}

bool ParseValue(TextCursor& cursor, const IecType& type, Value& out_value, std::string& out_error);

bool ParseArrayValue(TextCursor& cursor, const IecType& type, Value& out_value, std::string& out_error) {
    if (!cursor.Consume('[')) {
        out_error = type.TypeName() + ": expected '['";
        return false;
    }

    std::vector<Value> items;
    while (!cursor.Consume(']')) {
        if (!items.empty() && !cursor.Consume(',')) {
            out_error = type.TypeName() + ": expected ',' between items";
            return false;
        }
        Value item;
        if (!ParseValue(cursor, *type.ElementType(), item, out_error)) {
            return false;
        }
        items.push_back(std::move(item));
    }

    if (items.size() != type.ElementCount()) {
        out_error = type.TypeName() + ": expected " + std::to_string(type.ElementCount()) + " items, got " +
            std::to_string(items.size());
        return false;
    }
    out_value = ArrayValue(std::move(items));
    return true;
}

bool ParseStructValue(TextCursor& cursor, const IecType& type, Value& out_value, std::string& out_error) {
    if (!cursor.Consume('{')) {
        out_error = type.TypeName() + ": expected '{'";
        return false;
    }

    std::vector<Value> parsed(type.Members().size());
    std::vector<bool> seen(type.Members().size(), false);
    bool first = true;
    while (!cursor.Consume('}')) {
        if (!first && !cursor.Consume(',')) {
            out_error = "expected ',' between struct members";
            return false;
        }
        first = false;

        const std::string_view name = cursor.ReadIdentifier();
        std::size_t member_index = type.Members().size();
        for (std::size_t index = 0; index < type.Members().size(); ++index) {
            if (type.Members()[index].name == name) {
                member_index = index;
            }
        }
        if (member_index == type.Members().size()) {
            out_error = "unknown member '" + std::string(name) + "'";
            return false;
        }
        if (seen[member_index]) {
            out_error = "member '" + std::string(name) + "' given twice";
            return false;
        }
        if (!cursor.Consume('=') && !cursor.ConsumeLiteral(":=")) {
            out_error = "expected '=' after member '" + std::string(name) + "'";
            return false;
        }
        if (!ParseValue(cursor, *type.Members()[member_index].type, parsed[member_index], out_error)) {
            return false;
        }
        seen[member_index] = true;
    }

    Value struct_value = StructValue();
    for (std::size_t index = 0; index < type.Members().size(); ++index) {
        if (!seen[index]) {
            out_error = "missing member '" + type.Members()[index].name + "'";
            return false;
        }
        struct_value.AddMember(type.Members()[index].name, std::move(parsed[index]));
    }
    out_value = std::move(struct_value);
    return true;
}

bool ParseValue(TextCursor& cursor, const IecType& type, Value& out_value, std::string& out_error) {
    switch (type.Kind()) {
        case IecKind::Array:
            return ParseArrayValue(cursor, type, out_value, out_error);
        case IecKind::Struct:
            return ParseStructValue(cursor, type, out_value, out_error);
        case IecKind::String: {
            std::string text;
            if (!cursor.ReadQuotedString(text, out_error)) {
                return false;
            }
            out_value = StringValue(std::move(text));
            return true;
        }
        case IecKind::Bool: {
            const std::string_view token = cursor.ReadIdentifier();
            const std::string upper = ToUpper(token);
            if (upper == "TRUE" || upper == "1") {
                out_value = BoolValue(true);
                return true;
            }
            if (upper == "FALSE" || upper == "0") {
                out_value = BoolValue(false);
                return true;
            }
            out_error = "invalid BOOL '" + std::string(token) + "'";
            return false;
        }
        case IecKind::Real:
        case IecKind::Lreal: {
            const std::string_view token = cursor.ReadNumberToken();
            double real_value = 0.0;
            if (!ParseRealToken(token, real_value)) {
                out_error = "invalid " + type.TypeName() + " '" + std::string(token) + "'";
                return false;
            }
            out_value = RealValue(real_value);
            return true;
        }
        default:
            break;
    }

    const std::string_view token = cursor.ReadNumberToken();
    if (!token.empty() && token.front() == '-') {
        std::int64_t signed_value = 0;
        if (!ParseSignedToken(token, signed_value)) {
            out_error = "invalid " + type.TypeName() + " '" + std::string(token) + "'";
            return false;
        }
        out_value = IntValue(signed_value);
        return true;
    }

    std::uint64_t unsigned_value = 0;
    if (!ParseUnsignedToken(token, unsigned_value)) {
        out_error = "invalid " + type.TypeName() + " '" + std::string(token) + "'";
        return false;
    }
    out_value = UIntValue(unsigned_value);
    return true;
}

}  // namespace

bool TryParseIecType(
    std::string_view text,
    std::shared_ptr<const IecType>& out_type,
    std::string& out_error) {
    TextCursor cursor(text);
    std::shared_ptr<const IecType> type;
    if (!ParseType(cursor, 0, type, out_error)) {
        return false;
    }
    if (!cursor.AtEnd()) {
        out_error = "unexpected trailing text at offset " + std::to_string(cursor.Offset());
        return false;
    }

    out_type = std::move(type);
    out_error.clear();
    return true;
}

bool TryParseIecValue(
    std::string_view text,
    const IecType& type,
    Value& out_value,
    std::string& out_error) {
    TextCursor cursor(text);
    Value value;
    if (!ParseValue(cursor, type, value, out_error)) {
        return false;
    }
    if (!cursor.AtEnd()) {
        out_error = "unexpected trailing text at offset " + std::to_string(cursor.Offset());
        return false;
    }

    // Range and shape checks live in the encoder; run them so bad input fails here.
    wire::ByteBuffer scratch;
    if (!type.ConvertToBuffer(value, scratch, out_error)) {
        return false;
    }

    out_value = std::move(value);
    out_error.clear();
    return true;
}

}  // namespace nvlink::schema
