// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.cpp
/// @brief JSON Patch (RFC 6902) evaluation on top of fetch/transform.

#include <jsonrfc/patch.h>
#include <jsonrfc/json_pointer.h>
#include <jsonrfc/pointer.h>
#include <jsonrfc/predicates.h>

namespace jsonrfc {
namespace patch {

namespace {

Error target_error(OpType op, const Value& parent, const Segment& segment)
{
    std::string reason;
    if (parent.is_vector()) {
        reason = is_array_append(parent, segment)
                 ? "append position cannot be " + std::string{op_type_name(op)} + "d"
                 : describe_segment(segment) + " is not a valid position (size " + std::to_string(parent.size()) + ")";
    } else if (parent.is_map()) {
        reason = "key \"" + segment_to_key(segment) + "\" not present";
    } else {
        reason = "parent of " + describe_segment(segment) + " is not a container";
    }
    return make_error(ErrorCode::InvalidTarget, std::string{op_type_name(op)} + ": " + reason);
}

/// Copy of `vec` with `value` inserted before `index`; elements are shared, not copied
ValueVector insert_before(const ValueVector& vec, std::size_t index, Value value)
{
    auto t = vec.take(index).transient();
    t.push_back(ValueBox{std::move(value)});
    for (std::size_t i = index; i < vec.size(); ++i) {
        t.push_back(vec[i]);
    }
    return t.persistent();
}

/// Copy of `vec` without the element at `index`
ValueVector erase_at(const ValueVector& vec, std::size_t index)
{
    auto t = vec.take(index).transient();
    for (std::size_t i = index + 1; i < vec.size(); ++i) {
        t.push_back(vec[i]);
    }
    return t.persistent();
}

Result<Value> apply_add(const Value& document, const PointerRef& path, const Value& value)
{
    return transform(document, path, [&value](const Value& parent, const Segment& segment) -> Result<Value> {
        if (is_array_index(parent, segment)) {
            return Value{insert_before(*parent.get_if<ValueVector>(), std::get<std::size_t>(segment), value)};
        }
        if (is_array_append(parent, segment)) {
            return Value{parent.get_if<ValueVector>()->push_back(ValueBox{value})};
        }
        if (auto* map = parent.get_if<ValueMap>()) {
            return Value{map->set(segment_to_key(segment), ValueBox{value})};
        }
        return target_error(OpType::Add, parent, segment);
    });
}

Result<Value> apply_replace(const Value& document, const PointerRef& path, const Value& value)
{
    return transform(document, path, [&value](const Value& parent, const Segment& segment) -> Result<Value> {
        if (is_array_index(parent, segment)) {
            return Value{parent.get_if<ValueVector>()->set(std::get<std::size_t>(segment), ValueBox{value})};
        }
        if (is_object_key(parent, segment)) {
            return Value{parent.get_if<ValueMap>()->set(segment_to_key(segment), ValueBox{value})};
        }
        return target_error(OpType::Replace, parent, segment);
    });
}

Result<Value> apply_remove(const Value& document, const PointerRef& path)
{
    return transform(document, path, [](const Value& parent, const Segment& segment) -> Result<Value> {
        if (is_array_index(parent, segment)) {
            return Value{erase_at(*parent.get_if<ValueVector>(), std::get<std::size_t>(segment))};
        }
        if (is_object_key(parent, segment)) {
            return Value{parent.get_if<ValueMap>()->erase(segment_to_key(segment))};
        }
        return target_error(OpType::Remove, parent, segment);
    });
}

} // anonymous namespace

// ============================================================
// Operation builders
// ============================================================

Operation add(PointerRef path, Value value)
{
    return Operation{OpType::Add, std::move(path), {}, std::move(value)};
}

Operation replace(PointerRef path, Value value)
{
    return Operation{OpType::Replace, std::move(path), {}, std::move(value)};
}

Operation remove(PointerRef path)
{
    return Operation{OpType::Remove, std::move(path), {}, {}};
}

Operation move(PointerRef from, PointerRef path)
{
    return Operation{OpType::Move, std::move(path), std::move(from), {}};
}

Operation copy(PointerRef from, PointerRef path)
{
    return Operation{OpType::Copy, std::move(path), std::move(from), {}};
}

// ============================================================
// Evaluation
// ============================================================

Result<Value> evaluate(const Value& document, const Operation& op)
{
    switch (op.op) {
        case OpType::Add:
            return apply_add(document, op.path, op.value);
        case OpType::Replace:
            return apply_replace(document, op.path, op.value);
        case OpType::Remove:
            return apply_remove(document, op.path);
        case OpType::Move: {
            // Two sequential steps: `path` sees the document after the removal
            auto value = fetch(document, op.from);
            if (!value) {
                return value;
            }
            return evaluate(document, std::vector<Operation>{remove(op.from), add(op.path, std::move(value).value())});
        }
        case OpType::Copy: {
            auto value = fetch(document, op.from);
            if (!value) {
                return value;
            }
            return apply_add(document, op.path, value.value());
        }
    }
    return make_error(ErrorCode::InvalidOperation, "Unknown operation type");
}

Result<Value> evaluate(const Value& document, const std::vector<Operation>& ops)
{
    Value current = document;
    for (std::size_t i = 0; i < ops.size(); ++i) {
        auto next = evaluate(current, ops[i]);
        if (!next) {
            detail::log_failure("patch::evaluate", make_error(next.error().code,
                "operation #" + std::to_string(i) + " (" + std::string{op_type_name(ops[i].op)} + " "
                + pointer_text(ops[i].path) + ") failed: " + next.error().message));
            return next;
        }
        current = std::move(next).value();
    }
    return current;
}

Result<Evaluated> evaluate_with_ops(const Value& document, std::vector<Operation> ops)
{
    auto result = evaluate(document, ops);
    if (!result) {
        return std::move(result).error();
    }
    return Evaluated{std::move(result).value(), std::move(ops)};
}

} // namespace patch
} // namespace jsonrfc
