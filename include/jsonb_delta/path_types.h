// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.h
/// @brief Path types for addressing sub-values of a document.
///
/// A Path is an ordered sequence of segments, each either an Object key or
/// an Array index. The empty Path addresses the document root.
///
/// ```cpp
/// Path path{PathSegment{"orders"}, PathSegment{std::size_t{0}}, PathSegment{"id"}};
/// path_to_string(path);   // "orders[0].id"
/// ```

#pragma once

#include <jsonb_delta/api.h>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace jsonb_delta {

/// A single path segment: Key(name) or Index(n)
using PathSegment = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathSegment>;

[[nodiscard]] inline bool is_key(const PathSegment& seg) noexcept
{
    return std::holds_alternative<std::string>(seg);
}

[[nodiscard]] inline bool is_index(const PathSegment& seg) noexcept
{
    return std::holds_alternative<std::size_t>(seg);
}

/// Render a path in the dotted grammar accepted by parse_path()
/// (e.g. "orders[0].id"). The root renders as the empty string.
[[nodiscard]] JSONB_DELTA_API std::string path_to_string(const Path& path);

/// Concatenate two paths (prefix followed by suffix)
[[nodiscard]] JSONB_DELTA_API Path join_paths(const Path& prefix, const Path& suffix);

} // namespace jsonb_delta
