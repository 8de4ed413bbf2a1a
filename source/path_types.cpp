// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.cpp
/// @brief Segment helpers shared by the traversal and patch code.

#include <jsonrfc/path_types.h>

#include <type_traits>

namespace jsonrfc {

std::string segment_to_key(const Segment& segment)
{
    if (auto* key = std::get_if<std::string>(&segment)) {
        return *key;
    }
    return std::to_string(std::get<std::size_t>(segment));
}

std::string describe_segment(const Segment& segment)
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "key \"" + v + "\"";
        } else {
            return "index " + std::to_string(v);
        }
    }, segment);
}

} // namespace jsonrfc
