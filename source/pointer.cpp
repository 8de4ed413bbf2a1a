// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.cpp
/// @brief Implementation of fetch and copy-on-write transform.

#include <jsonrfc/pointer.h>
#include <jsonrfc/json_pointer.h>

namespace jsonrfc {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

/// Child of `node` at `segment` without copying, or nullptr.
/// Index segments are re-stringified when they meet an object.
const Value* child_at(const Value& node, const Segment& segment)
{
    if (node.is_map()) {
        return node.find(segment_to_key(segment));
    }
    if (node.is_vector()) {
        if (auto* index = std::get_if<std::size_t>(&segment)) {
            return node.find(*index);
        }
    }
    return nullptr;
}

/// InvalidPath error describing why `segment` cannot be followed from `node`
Error path_error(const Value& node, const Segment& segment, std::size_t position)
{
    const auto where = describe_segment(segment) + " at path position " + std::to_string(position);

    if (node.is_map()) {
        return make_error(ErrorCode::InvalidPath, "Key not found: " + where);
    }
    if (node.is_vector()) {
        if (std::holds_alternative<std::size_t>(segment)) {
            return make_error(ErrorCode::InvalidPath,
                              "Index out of range: " + where + " (size " + std::to_string(node.size()) + ")");
        }
        if (std::get<std::string>(segment) == append_marker) {
            return make_error(ErrorCode::InvalidPath, "Append position holds no value: " + where);
        }
        return make_error(ErrorCode::InvalidPath, "Not an array index: " + where);
    }
    return make_error(ErrorCode::InvalidPath, "Type mismatch: expected container at " + where);
}

/// Recursive helper for transform: rebuilds the ancestors of the target,
/// sharing every untouched subtree with `node`
Result<Value> transform_recursive(
    const Value& node,
    const Path& path,
    std::size_t path_index,
    const Update& update)
{
    const auto remaining = path.size() - path_index;

    if (remaining == 0) {
        if (auto* direct = std::get_if<DirectUpdate>(&update)) {
            if (!*direct) {
                return make_error(ErrorCode::Rejected, "Empty update function");
            }
            return (*direct)(node);
        }
        return make_error(ErrorCode::InvalidPath, "Empty path has no parent container");
    }

    const auto& segment = path[path_index];

    if (remaining == 1) {
        if (auto* on_container = std::get_if<ContainerUpdate>(&update)) {
            if (!*on_container) {
                return make_error(ErrorCode::Rejected, "Empty update function");
            }
            return (*on_container)(node, segment);
        }
    }

    if (auto* map = node.get_if<ValueMap>()) {
        auto key = segment_to_key(segment);
        auto* found = map->find(key);
        if (!found) {
            return path_error(node, segment, path_index);
        }
        auto child = transform_recursive(found->get(), path, path_index + 1, update);
        if (!child) {
            return child;
        }
        return Value{map->set(std::move(key), ValueBox{std::move(child).value()})};
    }

    if (auto* vec = node.get_if<ValueVector>()) {
        auto* index = std::get_if<std::size_t>(&segment);
        if (!index || *index >= vec->size()) {
            return path_error(node, segment, path_index);
        }
        auto child = transform_recursive((*vec)[*index].get(), path, path_index + 1, update);
        if (!child) {
            return child;
        }
        return Value{vec->set(*index, ValueBox{std::move(child).value()})};
    }

    return path_error(node, segment, path_index);
}

} // anonymous namespace

// ============================================================
// Public API Implementation
// ============================================================

Result<Value> fetch(const Value& document, const Path& path)
{
    const Value* current = &document;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const Value* next = child_at(*current, path[i]);
        if (!next) {
            auto error = path_error(*current, path[i], i);
            detail::log_failure("fetch", error);
            return error;
        }
        current = next;
    }
    return *current;
}

Result<Value> fetch(const Value& document, const PointerRef& pointer)
{
    if (auto* path = std::get_if<Path>(&pointer)) {
        return fetch(document, *path);
    }
    auto path = parse_json_pointer(std::get<std::string>(pointer));
    if (!path) {
        return std::move(path).error();
    }
    return fetch(document, path.value());
}

Result<Value> transform(const Value& document, const Path& path, const Update& update)
{
    auto result = transform_recursive(document, path, 0, update);
    if (!result) {
        detail::log_failure("transform", result.error());
    }
    return result;
}

Result<Value> transform(const Value& document, const PointerRef& pointer, const Update& update)
{
    if (auto* path = std::get_if<Path>(&pointer)) {
        return transform(document, *path, update);
    }
    auto path = parse_json_pointer(std::get<std::string>(pointer));
    if (!path) {
        return std::move(path).error();
    }
    return transform(document, path.value(), update);
}

} // namespace jsonrfc
