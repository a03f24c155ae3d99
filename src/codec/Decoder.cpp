#include "yamlite/codec/Decoder.hpp"

#include "yamlite/codec/Scalar.hpp"
#include "yamlite/core/Logger.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace yamlite::codec::Decoder {

namespace {

using core::Logger;

struct LineInfo {
    int indent = 0;
    std::string raw;
    std::string text;
    std::size_t number = 0;
    bool comment = false;
};

enum class FrameKind {
    Pending,
    Mapping,
    Sequence
};

// Container receiving the lines indented deeper than `indent`.
struct Frame {
    Value* node = nullptr;
    FrameKind kind = FrameKind::Pending;
    int indent = -1;
};

int CountIndent(std::string_view line) {
    int indent = 0;
    while (static_cast<std::size_t>(indent) < line.size() && line[static_cast<std::size_t>(indent)] == ' ') {
        ++indent;
    }
    return indent;
}

bool IsSequenceItem(std::string_view text) {
    return text == "-" || text.rfind("- ", 0) == 0;
}

bool IsBlockIndicator(std::string_view value) {
    return value == "|" || value == ">";
}

std::vector<LineInfo> Tokenize(std::string_view source) {
    std::vector<LineInfo> lines;
    std::size_t lineNumber = 0;
    std::size_t start = 0;
    while (start < source.size()) {
        std::size_t end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        std::string_view raw = source.substr(start, end - start);
        start = end + 1;
        ++lineNumber;

        if (lineNumber == 1 && raw.rfind("\xEF\xBB\xBF", 0) == 0) {
            raw.remove_prefix(3);
        }
        while (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }
        const std::string_view trimmed = Scalar::TrimView(raw);
        if (trimmed.empty()) {
            continue;
        }

        LineInfo info;
        info.indent = CountIndent(raw);
        info.raw = std::string(raw);
        info.text = std::string(trimmed);
        info.number = lineNumber;
        info.comment = trimmed.front() == '#';
        lines.push_back(std::move(info));
    }
    return lines;
}

std::size_t NextContentLine(const std::vector<LineInfo>& lines, std::size_t index) {
    std::size_t next = index + 1;
    while (next < lines.size() && lines[next].comment) {
        ++next;
    }
    return next;
}

// Kind of container an empty value opens, decided by the shape of the next line.
// Nothing when the next line is not indented deeper than `indent`.
std::optional<FrameKind> LookaheadContainer(const std::vector<LineInfo>& lines,
                                            std::size_t index,
                                            int indent) {
    const std::size_t next = NextContentLine(lines, index);
    if (next >= lines.size() || lines[next].indent <= indent) {
        return std::nullopt;
    }
    return IsSequenceItem(lines[next].text) ? FrameKind::Sequence : FrameKind::Mapping;
}

Value MakeContainer(FrameKind kind) {
    return kind == FrameKind::Sequence ? Value::array() : Value::object();
}

// Consumes every line after `index` indented deeper than `indent`. The indentation of
// the first body line is stripped from each line. Leaves `index` on the last body line.
std::string ReadBlockScalar(const std::vector<LineInfo>& lines, std::size_t& index, int indent) {
    std::string text;
    int blockIndent = -1;
    bool first = true;
    while (index + 1 < lines.size() && lines[index + 1].indent > indent) {
        ++index;
        const LineInfo& line = lines[index];
        if (blockIndent < 0) {
            blockIndent = line.indent;
        }
        const int strip = std::min(line.indent, blockIndent);
        if (!first) {
            text.push_back('\n');
        }
        text.append(line.raw, static_cast<std::size_t>(strip), std::string::npos);
        first = false;
    }
    return text;
}

void ParseEntry(const std::vector<LineInfo>& lines,
                std::size_t& index,
                std::string_view entry,
                int indent,
                Value& mapping,
                std::vector<Frame>& stack) {
    const std::size_t colonPos = entry.find(':');
    const std::string_view rawKey = Scalar::TrimView(entry.substr(0, colonPos));
    if (rawKey.empty()) {
        Logger::Debug("[Decoder] Line {}: mapping entry without a key", lines[index].number);
        return;
    }
    std::string key = Scalar::IsQuoted(rawKey) ? std::string(rawKey.substr(1, rawKey.size() - 2))
                                               : std::string(rawKey);
    const std::string_view value = Scalar::TrimView(entry.substr(colonPos + 1));

    if (IsBlockIndicator(value)) {
        mapping[key] = ReadBlockScalar(lines, index, indent);
        return;
    }

    if (value.empty()) {
        const auto kind = LookaheadContainer(lines, index, indent);
        if (!kind) {
            mapping[key] = Value();
            return;
        }
        Value& child = mapping[key];
        child = MakeContainer(*kind);
        stack.push_back(Frame{&child, *kind, indent});
        return;
    }

    mapping[key] = Scalar::Parse(value);
}

void AppendSequenceItem(const std::vector<LineInfo>& lines,
                        std::size_t& index,
                        std::vector<Frame>& stack) {
    const LineInfo& line = lines[index];
    Frame& frame = stack.back();
    if (frame.kind == FrameKind::Pending) {
        *frame.node = Value::array();
        frame.kind = FrameKind::Sequence;
    }
    if (frame.kind != FrameKind::Sequence) {
        Logger::Debug("[Decoder] Line {}: list item inside a mapping, skipped", line.number);
        return;
    }

    Value* sequence = frame.node;
    const std::string_view text = line.text;
    const std::string_view rest = Scalar::TrimView(text.substr(1));

    if (rest.empty()) {
        const auto kind = LookaheadContainer(lines, index, line.indent);
        if (!kind) {
            sequence->push_back(Value());
            return;
        }
        sequence->push_back(MakeContainer(*kind));
        stack.push_back(Frame{&sequence->back(), *kind, line.indent});
        return;
    }

    if (IsBlockIndicator(rest)) {
        sequence->push_back(ReadBlockScalar(lines, index, line.indent));
        return;
    }

    if (rest.find(':') != std::string_view::npos && !Scalar::IsQuoted(rest)) {
        sequence->push_back(Value::object());
        Value& mapping = sequence->back();
        stack.push_back(Frame{&mapping, FrameKind::Mapping, line.indent});
        const int column = line.indent + static_cast<int>(rest.data() - text.data());
        ParseEntry(lines, index, rest, column, mapping, stack);
        return;
    }

    sequence->push_back(Scalar::Parse(rest));
}

void AddMappingEntry(const std::vector<LineInfo>& lines,
                     std::size_t& index,
                     std::vector<Frame>& stack) {
    const LineInfo& line = lines[index];
    Frame& frame = stack.back();
    if (frame.kind == FrameKind::Pending) {
        frame.kind = FrameKind::Mapping;
    }
    if (frame.kind != FrameKind::Mapping) {
        Logger::Debug("[Decoder] Line {}: mapping entry inside a list, skipped", line.number);
        return;
    }
    Value& mapping = *frame.node;
    ParseEntry(lines, index, line.text, line.indent, mapping, stack);
}

} // namespace

Value Decode(std::string_view source) {
    const auto lines = Tokenize(source);
    Value root = Value::object();

    std::vector<Frame> stack;
    stack.push_back(Frame{&root, FrameKind::Pending, -1});

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.comment) {
            continue;
        }

        while (stack.size() > 1 && stack.back().indent >= line.indent) {
            stack.pop_back();
        }

        if (IsSequenceItem(line.text)) {
            AppendSequenceItem(lines, i, stack);
        } else if (line.text.find(':') != std::string::npos) {
            AddMappingEntry(lines, i, stack);
        } else {
            Logger::Debug("[Decoder] Line {}: unrecognised line '{}', skipped", line.number, line.text);
        }
    }

    return root;
}

bool Parse(std::string_view source, Value& out, std::string& error) {
    out = Decode(source);
    error.clear();
    return true;
}

} // namespace yamlite::codec::Decoder
