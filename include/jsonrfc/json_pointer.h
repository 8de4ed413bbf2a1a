// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) parsing and formatting.
///
///   "/users/0/name"  ->  ["users", 0, "name"]
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// Key features:
/// - Pointers start with "/"; the empty pointer "" refers to the whole document
/// - Segments separated by "/"
/// - Escapes are decoded in a fixed order: \" then \\ then ~1 then ~0,
///   so "~01" decodes to "~1" and never to "/1"
/// - "0" and digit strings without a leading zero become indices; "03",
///   "8bar" and "-" stay string keys

#pragma once

#include <jsonrfc/api.h>
#include <jsonrfc/path_types.h>
#include <jsonrfc/result.h>

#include <string>
#include <string_view>

namespace jsonrfc {

// Parse JSON Pointer string into Path
// Examples:
//   "/users/0/name"  -> ["users", 0, "name"]
//   ""               -> []  (root)
//   "/"              -> [""]  (key is empty string)
//   "users"          -> ErrorCode::InvalidPointer
[[nodiscard]] JSONRFC_API Result<Path> parse_json_pointer(std::string_view pointer);

// Convert Path back to JSON Pointer string
// Not a byte-for-byte inverse of parse_json_pointer(), but the result
// addresses the same location.
[[nodiscard]] JSONRFC_API std::string path_to_json_pointer(const Path& path);

// Parse the text alternative of a PointerRef, or pass a Path through
[[nodiscard]] JSONRFC_API Result<Path> resolve_pointer(const PointerRef& pointer);

// Pointer text for either alternative of a PointerRef (for messages and records)
[[nodiscard]] JSONRFC_API std::string pointer_text(const PointerRef& pointer);

} // namespace jsonrfc
