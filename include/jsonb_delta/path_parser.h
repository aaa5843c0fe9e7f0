// path_parser.h - Dotted path string parsing

#pragma once

#include <jsonb_delta/api.h>
#include <jsonb_delta/error.h>
#include <jsonb_delta/path_types.h>

#include <string_view>

namespace jsonb_delta {

/// Whether the empty string (the root path) is acceptable
enum class PathRequirement {
    AllowRoot,
    NonRoot,
};

/// @brief Parse a dotted path string into a Path
///
/// Grammar:
/// @code
///   path       := segment ("." segment | index)*
///   segment    := identifier index*
///   index      := "[" integer "]"
///   identifier := one or more characters other than '.', '[' and ']'
///   integer    := one or more ASCII digits
/// @endcode
///
/// Examples: "name", "orders[0]", "orders[0].items[2].sku", "m[0][1]".
///
/// The empty string is the root path unless @p requirement is NonRoot.
/// Every failure is ErrorCode::ParseError with Error::offset pointing at the
/// offending byte:
/// - empty identifier ("a..b", ".a", "a.", "[0]")
/// - unterminated '[' ("a[1")
/// - index content that is empty, signed, non-numeric or too large
///   ("a[]", "a[-1]", "a[ ]", "a[x]")
/// - anything other than '.' or '[' after a closing ']' ("a[0]b")
///
/// @example
///   auto path = parse_path("orders[0].status").value();
///   // {"orders", 0, "status"}
[[nodiscard]] JSONB_DELTA_API Result<Path> parse_path(std::string_view text,
                                                      PathRequirement requirement = PathRequirement::AllowRoot);

} // namespace jsonb_delta
