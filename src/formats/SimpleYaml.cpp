#include "mm/formats/SimpleYaml.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace mm::formats::SimpleYaml {

namespace {

struct LineInfo {
    int indent = 0;
    std::string text;
    std::size_t number = 0;
};

enum class FrameKind {
    Object,
    Array
};

struct Frame {
    nlohmann::json* node = nullptr;
    FrameKind kind = FrameKind::Object;
    int indent = 0;
};

std::string_view TrimView(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::string Trim(std::string_view value) {
    return std::string(TrimView(value));
}

bool IsQuoted(std::string_view value) {
    return value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front();
}

std::string Unquote(std::string_view value) {
    value = TrimView(value);
    if (IsQuoted(value)) {
        return std::string(value.substr(1, value.size() - 2));
    }
    return std::string(value);
}

// Position of the ':' that separates a mapping key from its value, skipping quoted keys.
std::size_t FindKeySeparator(std::string_view text) {
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if ((c == '"' || c == '\'') && i == 0) {
            quote = c;
            continue;
        }
        if (c == ':' && (i + 1 == text.size() || text[i + 1] == ' ')) {
            return i;
        }
    }
    return std::string_view::npos;
}

bool StartsNumber(std::string_view value) {
    if (!value.empty() && (value.front() == '-' || value.front() == '+')) {
        value.remove_prefix(1);
    }
    return !value.empty() && (std::isdigit(static_cast<unsigned char>(value.front())) || value.front() == '.');
}

template <typename T>
bool ParseWhole(std::string_view value, T& out, int base = 10) {
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out, base);
    return ec == std::errc() && end == value.data() + value.size();
}

bool ParseWholeDouble(std::string_view value, double& out) {
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    return ec == std::errc() && end == value.data() + value.size();
}

bool ParseUnsigned(std::string_view value, std::uint64_t& out) {
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        return ParseWhole(value.substr(2), out, 16);
    }
    return ParseWhole(value, out);
}

// Plain numbers: int64 first, then uint64 for values past its range, then double.
bool ParseNumber(std::string_view value, nlohmann::json& out) {
    if (!StartsNumber(value)) {
        return false;
    }
    if (value.front() == '+') {
        value.remove_prefix(1);
    }
    std::int64_t integer = 0;
    if (ParseWhole(value, integer)) {
        out = integer;
        return true;
    }
    std::uint64_t unsignedInteger = 0;
    if (ParseWhole(value, unsignedInteger)) {
        out = unsignedInteger;
        return true;
    }
    double number = 0.0;
    if (ParseWholeDouble(value, number)) {
        out = number;
        return true;
    }
    return false;
}

bool ParseTagged(std::string_view tag, std::string_view value, nlohmann::json& out, std::string& error,
                 std::size_t lineNumber) {
    if (tag == "!u" || tag == "!ul") {
        std::uint64_t number = 0;
        if (!ParseUnsigned(value, number)) {
            error = fmt::format("Line {}: {} expects an unsigned integer, got '{}'", lineNumber, tag, value);
            return false;
        }
        if (tag == "!u" && number > std::numeric_limits<std::uint32_t>::max()) {
            error = fmt::format("Line {}: {} does not fit in 32 bits", lineNumber, value);
            return false;
        }
        out = nlohmann::json{{tag == "!u" ? "@u32" : "@u64", number}};
        return true;
    }
    if (tag == "!l") {
        std::int64_t number = 0;
        if (!ParseWhole(value, number)) {
            error = fmt::format("Line {}: !l expects a signed integer, got '{}'", lineNumber, value);
            return false;
        }
        out = nlohmann::json{{"@i64", number}};
        return true;
    }
    if (tag == "!f64") {
        double number = 0.0;
        if (!ParseWholeDouble(value, number)) {
            error = fmt::format("Line {}: !f64 expects a number, got '{}'", lineNumber, value);
            return false;
        }
        out = nlohmann::json{{"@f64", number}};
        return true;
    }
    error = fmt::format("Line {}: unsupported tag '{}'", lineNumber, tag);
    return false;
}

bool ParseScalar(std::string_view value, nlohmann::json& out, std::string& error, std::size_t lineNumber);

// Flat flow list of scalars, e.g. [0.0, 1.5, "a, b"].
bool ParseFlowList(std::string_view value, nlohmann::json& out, std::string& error, std::size_t lineNumber) {
    out = nlohmann::json::array();
    std::string_view body = TrimView(value.substr(1, value.size() - 2));
    if (body.empty()) {
        return true;
    }
    char quote = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= body.size(); ++i) {
        const char c = i < body.size() ? body[i] : ',';
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            continue;
        }
        if (c == '[' || c == '{') {
            error = fmt::format("Line {}: nested flow collections are not supported", lineNumber);
            return false;
        }
        if (c == ',') {
            nlohmann::json element;
            if (!ParseScalar(body.substr(start, i - start), element, error, lineNumber)) {
                return false;
            }
            out.push_back(std::move(element));
            start = i + 1;
        }
    }
    return true;
}

bool ParseScalar(std::string_view value, nlohmann::json& out, std::string& error, std::size_t lineNumber) {
    value = TrimView(value);
    if (value.empty() || value == "~" || value == "null" || value == "Null" || value == "NULL") {
        out = nlohmann::json();
        return true;
    }
    if (value == "true" || value == "True" || value == "TRUE") {
        out = true;
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE") {
        out = false;
        return true;
    }
    if (IsQuoted(value)) {
        out = std::string(value.substr(1, value.size() - 2));
        return true;
    }
    if (value.front() == '!') {
        const auto space = value.find(' ');
        if (space == std::string_view::npos) {
            error = fmt::format("Line {}: tag '{}' has no value", lineNumber, value);
            return false;
        }
        return ParseTagged(value.substr(0, space), TrimView(value.substr(space + 1)), out, error, lineNumber);
    }
    if (value.front() == '[' && value.back() == ']') {
        return ParseFlowList(value, out, error, lineNumber);
    }
    if (value == "{}") {
        out = nlohmann::json::object();
        return true;
    }
    if (ParseNumber(value, out)) {
        return true;
    }
    out = std::string(value);
    return true;
}

bool NextLineIsListItem(const std::vector<LineInfo>& lines, std::size_t currentIndex, int currentIndent) {
    for (std::size_t i = currentIndex + 1; i < lines.size(); ++i) {
        if (lines[i].text.empty()) {
            continue;
        }
        if (lines[i].indent < currentIndent) {
            return false;
        }
        // Block lists may sit at the parent key's indentation.
        return lines[i].text.rfind("- ", 0) == 0 || lines[i].text == "-";
    }
    return false;
}

bool EnsureObject(Frame& frame, std::string& error, std::size_t lineNumber) {
    if (!frame.node->is_object() && !frame.node->is_null()) {
        error = fmt::format("Line {}: expected mapping but found different type", lineNumber);
        return false;
    }
    if (frame.node->is_null()) {
        *frame.node = nlohmann::json::object();
    }
    return true;
}

bool EnsureArray(Frame& frame, std::string& error, std::size_t lineNumber) {
    if (!frame.node->is_array() && !frame.node->is_null()) {
        error = fmt::format("Line {}: expected list but found different type", lineNumber);
        return false;
    }
    if (frame.node->is_null()) {
        *frame.node = nlohmann::json::array();
    }
    return true;
}

// Cuts a trailing comment; '#' counts only outside quotes and after whitespace.
void StripComment(std::string& raw) {
    char quote = 0;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char c = raw[i];
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || raw[i - 1] == ' ' || raw[i - 1] == '\t')) {
            raw.erase(i);
            return;
        }
    }
}

std::vector<LineInfo> Tokenize(const std::string& source) {
    std::vector<LineInfo> lines;
    std::istringstream stream(source);
    std::string raw;
    std::size_t lineNumber = 0;
    while (std::getline(stream, raw)) {
        ++lineNumber;
        if (lineNumber == 1 && raw.size() >= 3 && static_cast<unsigned char>(raw[0]) == 0xEF &&
            static_cast<unsigned char>(raw[1]) == 0xBB && static_cast<unsigned char>(raw[2]) == 0xBF) {
            raw.erase(0, 3);
        }
        StripComment(raw);
        std::string_view trimmed = raw;
        while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == '\n')) {
            trimmed.remove_suffix(1);
        }
        int indent = 0;
        while (!trimmed.empty() && trimmed.front() == ' ') {
            ++indent;
            trimmed.remove_prefix(1);
        }
        std::string text = Trim(trimmed);
        if (text == "---" || text == "...") {
            text.clear();
        }
        lines.push_back(LineInfo{indent, std::move(text), lineNumber});
    }
    return lines;
}

} // namespace

bool Parse(const std::string& source, nlohmann::json& out, std::string& error) {
    const auto lines = Tokenize(source);
    out = nlohmann::json::object();

    std::vector<Frame> stack;
    stack.push_back(Frame{&out, FrameKind::Object, 0});

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.text.empty()) {
            continue;
        }
        if (line.indent % 2 != 0) {
            error = fmt::format("Line {}: indentation must be multiples of two spaces", line.number);
            return false;
        }

        const bool listItem = line.text.rfind("- ", 0) == 0 || line.text == "-";
        while (stack.size() > 1 && (line.indent < stack.back().indent ||
                                    (!listItem && stack.back().kind == FrameKind::Array &&
                                     line.indent <= stack.back().indent))) {
            stack.pop_back();
        }

        Frame& frame = stack.back();
        if (listItem) {
            if (frame.kind != FrameKind::Array) {
                error = fmt::format("Line {}: list item without list context", line.number);
                return false;
            }
            if (!EnsureArray(frame, error, line.number)) {
                return false;
            }

            const std::string valuePart = line.text.size() > 1 ? Trim(line.text.substr(2)) : std::string();
            if (valuePart.empty()) {
                frame.node->push_back(nlohmann::json::object());
                stack.push_back(Frame{&frame.node->back(), FrameKind::Object, line.indent + 2});
                continue;
            }

            const auto colonPos = FindKeySeparator(valuePart);
            if (colonPos != std::string::npos) {
                nlohmann::json element = nlohmann::json::object();
                nlohmann::json& child = element[Unquote(valuePart.substr(0, colonPos))];
                if (!ParseScalar(valuePart.substr(colonPos + 1), child, error, line.number)) {
                    return false;
                }
                frame.node->push_back(std::move(element));
                stack.push_back(Frame{&frame.node->back(), FrameKind::Object, line.indent + 2});
            } else {
                nlohmann::json element;
                if (!ParseScalar(valuePart, element, error, line.number)) {
                    return false;
                }
                frame.node->push_back(std::move(element));
            }
            continue;
        }

        const auto colonPos = FindKeySeparator(line.text);
        if (colonPos == std::string::npos) {
            error = fmt::format("Line {}: expected ':' in mapping entry", line.number);
            return false;
        }

        if (!EnsureObject(frame, error, line.number)) {
            return false;
        }

        const std::string key = Unquote(line.text.substr(0, colonPos));
        const std::string value = Trim(line.text.substr(colonPos + 1));

        nlohmann::json& child = (*frame.node)[key];
        if (value.empty()) {
            if (NextLineIsListItem(lines, i, line.indent)) {
                child = nlohmann::json::array();
                stack.push_back(Frame{&child, FrameKind::Array, line.indent});
            } else {
                child = nlohmann::json::object();
                stack.push_back(Frame{&child, FrameKind::Object, line.indent + 2});
            }
        } else if (!ParseScalar(value, child, error, line.number)) {
            return false;
        }
    }

    return true;
}

bool LoadStructuredFile(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = fmt::format("Failed to open '{}'", path.string());
        return false;
    }

    const auto ext = path.extension().string();
    if (ext == ".json" || ext == ".JSON") {
        try {
            file >> out;
            error.clear();
            return true;
        } catch (const nlohmann::json::exception& e) {
            error = fmt::format("JSON parse error in '{}': {}", path.string(), e.what());
            return false;
        }
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string parseError;
    if (!Parse(buffer.str(), out, parseError)) {
        error = fmt::format("YAML parse error in '{}': {}", path.string(), parseError);
        return false;
    }
    error.clear();
    return true;
}

} // namespace mm::formats::SimpleYaml
