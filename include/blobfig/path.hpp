#pragma once

#include "blobfig/view.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobfig {

// Path rules:
//   - segments are separated by '/'
//   - one leading '/' and one trailing '/' are ignored ("/a/b/" == "a/b")
//   - "" and "/" address the root
//   - an empty interior segment ("a//b") makes the path malformed
//   - every segment except the last must land on an Object

/// Split a path into its segments. nullopt when the path is malformed.
std::optional<std::vector<std::string_view>> split_path(std::string_view path);

/// Resolve `path` below `root`. nullopt when a segment is missing, an
/// intermediate is not an Object, or the path is malformed. Malformed bytes
/// met on the way still throw DecodeError.
std::optional<ValueView> get(const ValueView& root, std::string_view path);

/// Like get() but throws AccessError naming which rule failed.
ValueView at(const ValueView& root, std::string_view path);

/// Join segments with '/'; used for diagnostics and tools.
std::string join_path(const std::vector<std::string_view>& parts, std::size_t upto);

} // namespace blobfig
