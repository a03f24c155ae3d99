#include "yamlite/codec/PathAccessor.hpp"

#include "yamlite/core/Logger.hpp"

#include <utility>

namespace yamlite::codec::PathAccessor {

std::vector<std::string> SplitPath(std::string_view path) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : path) {
        if (c == '.') {
            if (!part.empty()) {
                parts.push_back(std::move(part));
                part.clear();
            }
        } else {
            part += c;
        }
    }
    if (!part.empty()) {
        parts.push_back(std::move(part));
    }
    return parts;
}

const Value* Find(const Value& tree, std::string_view path) {
    const Value* node = &tree;
    for (const auto& key : SplitPath(path)) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

std::optional<Value> Get(const Value& tree, std::string_view path) {
    if (const Value* found = Find(tree, path)) {
        return *found;
    }
    return std::nullopt;
}

bool Contains(const Value& tree, std::string_view path) {
    return Find(tree, path) != nullptr;
}

Value& Set(Value& tree, std::string_view path, Value value) {
    const auto keys = SplitPath(path);
    if (keys.empty()) {
        core::Logger::Warning("[PathAccessor] Ignoring Set with empty path '{}'", path);
        return tree;
    }

    Value* node = &tree;
    for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
        if (!node->is_object()) {
            *node = Value::object();
        }
        // operator[] on a mapping inserts a null child when the key is missing
        node = &(*node)[keys[i]];
    }
    if (!node->is_object()) {
        *node = Value::object();
    }
    (*node)[keys.back()] = std::move(value);
    return tree;
}

} // namespace yamlite::codec::PathAccessor
