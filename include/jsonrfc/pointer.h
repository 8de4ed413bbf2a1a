// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer.h
/// @brief Core traversal engine: fetch and copy-on-write transform.
///
/// Both functions accept either pointer text or a pre-parsed Path. Text is
/// parsed first; a parse failure is reported as ErrorCode::InvalidPointer
/// without the document being looked at.
///
/// ## Update shapes
///
/// transform() takes one of two callback shapes:
///
/// - **DirectUpdate** `(const Value& target) -> Result<Value>`
///   receives the value at the end of the path; its result replaces it.
/// - **ContainerUpdate** `(const Value& parent, const Segment& last) -> Result<Value>`
///   receives the container holding the final segment; its result replaces
///   the whole container. Use it to insert, delete or shift.
///
/// Callbacks may return a bare Value (success) or an Error; an Error aborts
/// the whole call and reaches the caller unchanged.
///
/// ```cpp
/// // {"foo": [1, 2, 3]} -> {"foo": [2, 2, 3]}
/// auto r = transform(doc, "/foo/0", [](const Value& v) {
///     return Value{v.as_int64() + 1};
/// });
///
/// // {"foo": {"bar": 3}} -> {"foo": {}}
/// auto d = transform(doc, "/foo/bar", [](const Value& parent, const Segment& key) {
///     return Value{parent.as_map().erase(segment_to_key(key))};
/// });
/// ```

#pragma once

#include <jsonrfc/api.h>
#include <jsonrfc/path_types.h>
#include <jsonrfc/result.h>
#include <jsonrfc/value.h>

#include <functional>
#include <variant>

namespace jsonrfc {

using DirectUpdate    = std::function<Result<Value>(const Value&)>;
using ContainerUpdate = std::function<Result<Value>(const Value&, const Segment&)>;

/// A lambda converts to whichever alternative matches its arity.
using Update = std::variant<DirectUpdate, ContainerUpdate>;

/// @brief Read the value at a path
/// @return The value, or InvalidPath when a key is missing, an index is out
///         of range or "-", or the path continues past a scalar
[[nodiscard]] JSONRFC_API Result<Value> fetch(const Value& document, const Path& path);
[[nodiscard]] JSONRFC_API Result<Value> fetch(const Value& document, const PointerRef& pointer);

/// @brief Persistently update the value at a path
/// @return A new document where only the nodes from the root to the target
///         were rebuilt, or the first Error encountered. The input is never
///         modified and no partially rebuilt document is ever returned.
[[nodiscard]] JSONRFC_API Result<Value> transform(const Value& document, const Path& path, const Update& update);
[[nodiscard]] JSONRFC_API Result<Value> transform(const Value& document, const PointerRef& pointer, const Update& update);

} // namespace jsonrfc
