// pointer_lens.cpp
// JSON Pointer lenses built on fetch/transform

#include <jsonrfc/pointer_lens.h>
#include <jsonrfc/json_pointer.h>
#include <jsonrfc/pointer.h>

#include <zug/compose.hpp>

namespace jsonrfc {

ValueLens json_pointer_lens(const PointerRef& pointer)
{
    auto path = resolve_pointer(pointer);
    if (!path) {
        // An unparsable pointer addresses nothing: view yields null, set is a no-op
        return lager::lenses::getset(
            [](const Value&) -> Value { return Value{}; },
            [](Value whole, Value) -> Value { return whole; });
    }

    if (path.value().empty()) {
        return zug::identity;
    }

    // Single lens over the whole path: one traversal for view, one rebuild for set
    return lager::lenses::getset(
        [path = path.value()](const Value& whole) -> Value {
            return fetch(whole, path).get_or(Value{});
        },
        [path = path.value()](Value whole, Value part) -> Value {
            auto updated = transform(whole, path, [&part](const Value&) -> Result<Value> {
                return part;
            });
            return updated ? std::move(updated).value() : std::move(whole);
        });
}

Value get_by_pointer(const Value& data, const PointerRef& pointer)
{
    auto lens = json_pointer_lens(pointer);
    return lager::view(lens, data);
}

Value set_by_pointer(const Value& data, const PointerRef& pointer, Value new_value)
{
    auto lens = json_pointer_lens(pointer);
    return lager::set(lens, data, std::move(new_value));
}

} // namespace jsonrfc
