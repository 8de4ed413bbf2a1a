// pointer_lens.h - JSON Pointers as lager::lens<Value, Value>

#pragma once

#include <jsonrfc/api.h>
#include <jsonrfc/path_types.h>
#include <jsonrfc/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <utility>

namespace jsonrfc {

using ValueLens = lager::lens<Value, Value>;

// ============================================================
// JSON Pointer lens functions
//
// view: fetch() at the pointer, null Value when it does not resolve
// set:  transform() at the pointer; the whole is returned unchanged when
//       the pointer does not resolve (no auto-vivification)
// ============================================================

[[nodiscard]] JSONRFC_API ValueLens json_pointer_lens(const PointerRef& pointer);

// Get value by JSON Pointer
// Returns null Value if path not found
[[nodiscard]] JSONRFC_API Value get_by_pointer(const Value& data, const PointerRef& pointer);

// Set value by JSON Pointer
// Returns new immutable Value with the change applied
[[nodiscard]] JSONRFC_API Value set_by_pointer(const Value& data, const PointerRef& pointer, Value new_value);

// Update value by JSON Pointer with a function
template<typename Fn>
[[nodiscard]] Value over_by_pointer(const Value& data, const PointerRef& pointer, Fn&& fn)
{
    auto lens = json_pointer_lens(pointer);
    return lager::over(lens, data, std::forward<Fn>(fn));
}

} // namespace jsonrfc
