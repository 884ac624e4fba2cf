#pragma once

#include "hostfleet/core/error.hpp"

#include <map>
#include <span>
#include <string>
#include <string_view>

namespace hostfleet {

// Configuration macros passed to instances as NAME=value arguments. Ordered so
// spawn command lines are stable.
using MacroMap = std::map<std::string, std::string, std::less<>>;

// Parses a shell-word string of NAME=value tokens ("a=1 'b=x y'").
// Blank input gives an empty map; a token without '=' or an empty name is a
// ParseError.
[[nodiscard]] auto parse_macro_string(std::string_view text) -> Result<MacroMap>;

// Parses command-line macro arguments (each exactly one NAME=value token).
[[nodiscard]] auto parse_macro_args(std::span<const std::string> args)
    -> Result<MacroMap>;

// Replaces every %NAME% occurrence whose NAME is in `values`; unknown
// placeholders are left untouched.
[[nodiscard]] auto expand_placeholders(std::string_view text,
                                       const MacroMap &values) -> std::string;

[[nodiscard]] auto contains_placeholder(std::string_view text,
                                        std::string_view name) -> bool;

} // namespace hostfleet
