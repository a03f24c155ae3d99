#include "yamlite/codec/Encoder.hpp"

#include "yamlite/codec/Scalar.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

namespace yamlite::codec::Encoder {

namespace {

constexpr std::string_view kSpecialChars = ":#[]{}";
constexpr std::string_view kLegacyKeywordClass = "true|false|yes|no|on|off|null";

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsDigits(std::string_view text, bool allowDots) {
    if (text.empty()) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [allowDots](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0 || (allowDots && c == '.');
    });
}

bool ReadsBackAsOtherScalar(std::string_view text) {
    const Value parsed = Scalar::Parse(text);
    return !parsed.is_string() || parsed.get_ref<const std::string&>() != text;
}

// Text the line reader takes as structure before the scalar reader ever sees it.
bool ReadsBackAsStructure(std::string_view text) {
    return text == "|" || text == ">" || text == "-" || text.rfind("- ", 0) == 0;
}

std::string Quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '\\': out.append("\\\\"); break;
            case '"':  out.append("\\\""); break;
            case '\n': out.append("\\n"); break;
            case '\r': out.append("\\r"); break;
            case '\t': out.append("\\t"); break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::string Indent(int depth) {
    return std::string(static_cast<std::size_t>(depth), ' ');
}

// Multi-line renderings start with '\n'; the caller decides what precedes them.
bool IsMultiLine(const std::string& rendered) {
    return !rendered.empty() && rendered.front() == '\n';
}

bool IsBlockString(std::string_view text) {
    return text.find('\n') != std::string_view::npos &&
           text.find_first_of(kSpecialChars) == std::string_view::npos;
}

// Empty lines are dropped; the decoder skips blank lines as well.
std::string RenderBlockString(std::string_view text, int depth) {
    std::string out = "|";
    const std::string pad = Indent(depth);
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (end > start) {
            out.push_back('\n');
            out.append(pad);
            out.append(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return out;
}

// nlohmann writes non-finite doubles as `null`.
std::string RenderNumber(const Value& value) {
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isnan(number)) {
            return ".nan";
        }
        if (std::isinf(number)) {
            return number < 0 ? "-.inf" : ".inf";
        }
    }
    return value.dump();
}

std::string RenderValue(const Value& value, int depth, const EncodeOptions& options);

std::string RenderSequence(const Value& sequence, int depth, const EncodeOptions& options) {
    if (sequence.empty()) {
        return "[]";
    }
    const std::string pad = Indent(depth);
    std::string out;
    for (const auto& element : sequence) {
        const std::string rendered = RenderValue(element, depth + options.indentWidth, options);
        out.push_back('\n');
        out.append(pad);
        if (IsMultiLine(rendered)) {
            out.push_back('-');
        } else {
            out.append("- ");
        }
        out.append(rendered);
    }
    return out;
}

std::string RenderMapping(const Value& mapping, int depth, const EncodeOptions& options) {
    if (mapping.empty()) {
        return "{}";
    }

    std::vector<std::pair<std::string_view, const Value*>> entries;
    entries.reserve(mapping.size());
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        entries.emplace_back(it.key(), &it.value());
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    const std::string pad = Indent(depth);
    std::string out;
    for (const auto& [key, child] : entries) {
        const std::string rendered = RenderValue(*child, depth + options.indentWidth, options);
        out.push_back('\n');
        out.append(pad);
        out.append(FormatString(key, options.quoting));
        if (IsMultiLine(rendered)) {
            out.push_back(':');
        } else {
            out.append(": ");
        }
        out.append(rendered);
    }
    return out;
}

std::string RenderValue(const Value& value, int depth, const EncodeOptions& options) {
    switch (value.type()) {
        case ValueType::boolean:
            return value.get<bool>() ? "true" : "false";
        case ValueType::number_integer:
        case ValueType::number_unsigned:
        case ValueType::number_float:
            return RenderNumber(value);
        case ValueType::string: {
            const auto& text = value.get_ref<const std::string&>();
            if (IsBlockString(text)) {
                return RenderBlockString(text, depth);
            }
            return FormatString(text, options.quoting);
        }
        case ValueType::array:
            return RenderSequence(value, depth, options);
        case ValueType::object:
            return RenderMapping(value, depth, options);
        case ValueType::null:
        case ValueType::binary:
        case ValueType::discarded:
            break;
    }
    return "null";
}

} // namespace

bool NeedsQuotes(std::string_view text, QuotingMode mode) {
    if (IsDigits(text, false) || IsDigits(text, true)) {
        return true;
    }
    if (mode == QuotingMode::Legacy) {
        if (text.size() == 1 && kLegacyKeywordClass.find(text.front()) != std::string_view::npos) {
            return true;
        }
    } else if (ReadsBackAsOtherScalar(text) || ReadsBackAsStructure(text)) {
        return true;
    }
    if (text.find_first_of(kSpecialChars) != std::string_view::npos) {
        return true;
    }
    if (!text.empty() && (IsSpace(text.front()) || IsSpace(text.back()))) {
        return true;
    }
    return text.find('\n') != std::string_view::npos;
}

std::string FormatString(std::string_view text, QuotingMode mode) {
    if (NeedsQuotes(text, mode)) {
        return Quote(text);
    }
    return std::string(text);
}

std::string Encode(const Value& value, const EncodeOptions& options) {
    EncodeOptions effective = options;
    effective.indentWidth = std::max(1, options.indentWidth);

    // A top-level block string still indents its body under the `|` line.
    const int depth = IsContainer(value) ? 0 : effective.indentWidth;
    std::string rendered = RenderValue(value, depth, effective);
    if (IsContainer(value) && IsMultiLine(rendered)) {
        rendered.erase(0, 1);
    }
    return rendered;
}

} // namespace yamlite::codec::Encoder
