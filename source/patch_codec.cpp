// patch_codec.cpp
// Conversion between patch::Operation and its structured record form

#include <jsonrfc/patch.h>
#include <jsonrfc/builders.h>
#include <jsonrfc/json_pointer.h>

#include <array>
#include <utility>

namespace jsonrfc {
namespace patch {

namespace {

constexpr std::array<std::pair<OpType, std::string_view>, 5> op_names{{
    {OpType::Add, "add"},
    {OpType::Replace, "replace"},
    {OpType::Remove, "remove"},
    {OpType::Move, "move"},
    {OpType::Copy, "copy"},
}};

bool has_from(OpType op) noexcept
{
    return op == OpType::Move || op == OpType::Copy;
}

bool has_value(OpType op) noexcept
{
    return op == OpType::Add || op == OpType::Replace;
}

Error record_error(std::string message)
{
    return make_error(ErrorCode::InvalidOperation, std::move(message));
}

/// Pointer member of a record; pointer text stays text until evaluation
Result<PointerRef> pointer_member(const Value& record, const std::string& name)
{
    const Value* member = record.find(name);
    if (!member) {
        return record_error("missing \"" + name + "\" member");
    }
    if (!member->is_string()) {
        return record_error("\"" + name + "\" must be a string, got " + value_to_string(*member));
    }
    return PointerRef{member->as_string()};
}

} // anonymous namespace

std::string_view op_type_name(OpType op) noexcept
{
    for (const auto& [type, name] : op_names) {
        if (type == op) {
            return name;
        }
    }
    return "unknown";
}

std::optional<OpType> parse_op_type(std::string_view name) noexcept
{
    for (const auto& [type, type_name] : op_names) {
        if (type_name == name) {
            return type;
        }
    }
    return std::nullopt;
}

Value operation_to_value(const Operation& op)
{
    MapBuilder builder;
    builder.set("op", std::string{op_type_name(op.op)});
    builder.set("path", pointer_text(op.path));
    if (has_from(op.op)) {
        builder.set("from", pointer_text(op.from));
    }
    if (has_value(op.op)) {
        builder.set("value", op.value);
    }
    return builder.finish();
}

Result<Operation> operation_from_value(const Value& record)
{
    if (!record.is_map()) {
        return record_error("operation record must be a map, got " + value_to_string(record));
    }

    const Value* op_member = record.find("op");
    if (!op_member || !op_member->is_string()) {
        return record_error("missing or non-string \"op\" member");
    }
    auto type = parse_op_type(op_member->as_string_view());
    if (!type) {
        return record_error("unknown op \"" + op_member->as_string() + "\"");
    }

    Operation op;
    op.op = *type;

    auto path = pointer_member(record, "path");
    if (!path) {
        return std::move(path).error();
    }
    op.path = std::move(path).value();

    if (has_from(op.op)) {
        auto from = pointer_member(record, "from");
        if (!from) {
            return std::move(from).error();
        }
        op.from = std::move(from).value();
    }

    if (has_value(op.op)) {
        const Value* value = record.find("value");
        if (!value) {
            return record_error("missing \"value\" member for " + op_member->as_string());
        }
        op.value = *value;
    }

    return op;
}

Value patch_to_value(const std::vector<Operation>& ops)
{
    VectorBuilder builder;
    for (const auto& op : ops) {
        builder.push_back(operation_to_value(op));
    }
    return builder.finish();
}

Result<std::vector<Operation>> patch_from_value(const Value& records)
{
    const auto* vec = records.get_if<ValueVector>();
    if (!vec) {
        return record_error("patch must be a sequence of operation records");
    }

    std::vector<Operation> ops;
    ops.reserve(vec->size());
    for (std::size_t i = 0; i < vec->size(); ++i) {
        auto op = operation_from_value((*vec)[i].get());
        if (!op) {
            auto error = std::move(op).error();
            error.message = "record #" + std::to_string(i) + ": " + error.message;
            return error;
        }
        ops.push_back(std::move(op).value());
    }
    return ops;
}

} // namespace patch
} // namespace jsonrfc
