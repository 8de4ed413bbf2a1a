// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.h
/// @brief Path types for addressing locations inside a Value tree.
///
/// - **Segment**: one step, either a string key or a numeric index
/// - **Path**: ordered segments, root to leaf (empty = the whole document)
/// - **PointerRef**: what callers pass wherever a location is needed, either
///   RFC 6901 pointer text or an already parsed Path
///
/// Parsing is context free: the parser cannot know whether "/foo/3" meets an
/// object or a sequence at "3", so it produces an index segment and the
/// traversal code re-stringifies it when it meets an object. Likewise "-"
/// stays a string segment and only means "append" against a sequence.
///
/// ```cpp
/// Path path{"users", std::size_t{0}, "name"};
/// auto name = fetch(doc, path);          // no re-parsing
/// auto same = fetch(doc, "/users/0/name");
/// ```

#pragma once

#include <jsonrfc/api.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonrfc {

/// A single path step: either a string key or a numeric index
using Segment = std::variant<std::string, std::size_t>;

/// Owning sequence of segments
using Path = std::vector<Segment>;

/// Pointer text or a pre-parsed Path
using PointerRef = std::variant<std::string, Path>;

/// The RFC 6901 token that designates the position past the last element
inline constexpr std::string_view append_marker = "-";

/// Key used when a segment meets an object: indices become their decimal text
[[nodiscard]] JSONRFC_API std::string segment_to_key(const Segment& segment);

/// Human-readable form used in error messages: key "foo" / index 3
[[nodiscard]] JSONRFC_API std::string describe_segment(const Segment& segment);

} // namespace jsonrfc
