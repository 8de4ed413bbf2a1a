// predicates.cpp - (container, segment) classification

#include <jsonrfc/predicates.h>

namespace jsonrfc {

bool is_array_index(const Value& container, const Segment& segment) noexcept
{
    const auto* vec = container.get_if<ValueVector>();
    const auto* index = std::get_if<std::size_t>(&segment);
    return vec && index && *index < vec->size();
}

bool is_array_append(const Value& container, const Segment& segment) noexcept
{
    const auto* key = std::get_if<std::string>(&segment);
    return container.is_vector() && key && *key == append_marker;
}

bool is_array(const Value& container, const Segment& segment) noexcept
{
    return is_array_index(container, segment) || is_array_append(container, segment);
}

bool is_object(const Value& value) noexcept
{
    return value.is_map();
}

bool is_object_key(const Value& container, const Segment& segment)
{
    return container.is_map() && container.contains(segment_to_key(segment));
}

} // namespace jsonrfc
