// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON Patch (RFC 6902) operations and their evaluation.
///
/// Supported operations: add, replace, remove, move, copy.
///
/// ```cpp
/// using namespace jsonrfc;
/// Value doc = Value::map({{"foo", Value::vector({})}, {"byebye", 5}});
/// auto result = patch::evaluate(doc, {
///     patch::add("/bar", 3),
///     patch::replace("/foo", Value::map({})),
///     patch::remove("/byebye"),
///     patch::move("/bar", "/foo/bar"),
///     patch::copy("/foo", "/baz"),
/// });
/// // result.value() == {"foo": {"bar": 3}, "baz": {"bar": 3}}
/// ```
///
/// Behaviour at the parent of the final segment:
///
/// | op      | sequence, index i        | sequence, "-" | object                  |
/// |---------|--------------------------|---------------|-------------------------|
/// | add     | insert before i          | append        | insert or overwrite key |
/// | replace | overwrite element i      | InvalidTarget | key must exist          |
/// | remove  | erase i, shift left      | InvalidTarget | key must exist          |
///
/// Any other parent (a scalar) is InvalidTarget.
///
/// move(from, path) is remove(from) followed by add(path, value): path is
/// resolved against the document *after* the removal, so index shifts caused
/// by the removal are visible to it.

#pragma once

#include <jsonrfc/api.h>
#include <jsonrfc/path_types.h>
#include <jsonrfc/result.h>
#include <jsonrfc/value.h>

#include <optional>
#include <string_view>
#include <vector>

namespace jsonrfc {
namespace patch {

enum class OpType {
    Add,
    Replace,
    Remove,
    Move,
    Copy,
};

/// One patch operation. `from` is only meaningful for Move and Copy,
/// `value` only for Add and Replace.
struct Operation {
    OpType op = OpType::Add;
    PointerRef path;
    PointerRef from;
    Value value;

    bool operator==(const Operation&) const = default;
};

// ============================================================
// Operation builders
// ============================================================

[[nodiscard]] JSONRFC_API Operation add(PointerRef path, Value value);
[[nodiscard]] JSONRFC_API Operation replace(PointerRef path, Value value);
[[nodiscard]] JSONRFC_API Operation remove(PointerRef path);
[[nodiscard]] JSONRFC_API Operation move(PointerRef from, PointerRef path);
[[nodiscard]] JSONRFC_API Operation copy(PointerRef from, PointerRef path);

// ============================================================
// Evaluation
// ============================================================

/// Apply a single operation
[[nodiscard]] JSONRFC_API Result<Value> evaluate(const Value& document, const Operation& op);

/// Apply operations left to right; the first failure is returned verbatim
/// and no intermediate document is exposed
[[nodiscard]] JSONRFC_API Result<Value> evaluate(const Value& document, const std::vector<Operation>& ops);

struct Evaluated {
    Value document;
    std::vector<Operation> ops;
};

/// Like evaluate(), but on success also hands back the applied operations
[[nodiscard]] JSONRFC_API Result<Evaluated> evaluate_with_ops(const Value& document, std::vector<Operation> ops);

// ============================================================
// Operation records
//
// The structured form of an operation is a map:
//   {"op": "add", "path": "/a/b", "value": 1}
//   {"op": "move", "from": "/a", "path": "/b"}
// ============================================================

[[nodiscard]] JSONRFC_API std::string_view op_type_name(OpType op) noexcept;
[[nodiscard]] JSONRFC_API std::optional<OpType> parse_op_type(std::string_view name) noexcept;

[[nodiscard]] JSONRFC_API Value operation_to_value(const Operation& op);
[[nodiscard]] JSONRFC_API Result<Operation> operation_from_value(const Value& record);

/// A patch document is a sequence of operation records
[[nodiscard]] JSONRFC_API Value patch_to_value(const std::vector<Operation>& ops);
[[nodiscard]] JSONRFC_API Result<std::vector<Operation>> patch_from_value(const Value& records);

} // namespace patch
} // namespace jsonrfc
