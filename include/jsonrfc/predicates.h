// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file predicates.h
/// @brief Classification of a (container, segment) pair.
///
/// The patch evaluator classifies the terminal access with these
/// before deciding whether to shift, insert or overwrite.

#pragma once

#include <jsonrfc/api.h>
#include <jsonrfc/path_types.h>
#include <jsonrfc/value.h>

namespace jsonrfc {

/// true iff container is a sequence and segment is an index below its size
[[nodiscard]] JSONRFC_API bool is_array_index(const Value& container, const Segment& segment) noexcept;

/// true iff container is a sequence and segment is the "-" append marker
[[nodiscard]] JSONRFC_API bool is_array_append(const Value& container, const Segment& segment) noexcept;

/// is_array_index() || is_array_append()
[[nodiscard]] JSONRFC_API bool is_array(const Value& container, const Segment& segment) noexcept;

/// true iff value is an object
[[nodiscard]] JSONRFC_API bool is_object(const Value& value) noexcept;

/// true iff container is an object holding segment_to_key(segment)
[[nodiscard]] JSONRFC_API bool is_object_key(const Value& container, const Segment& segment);

} // namespace jsonrfc
