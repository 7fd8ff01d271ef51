#pragma once

#include "core/key_spec.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace keychord
{
// Key text grammar:
//
//   sequence = key (whitespace+ key)*
//   key      = (modifier "-")* atom
//   modifier = "ctrl" | "alt" | "shift" | "cmd"   (case-insensitive, any order)
//   atom     = "@" group | named | fn | char
//   group    = "upper" | "lower" | "alpha" | "alnum" | "digit" | "any"   (case-sensitive)
//   named    = "enter" | "esc" | "up" | "pagedown" | ...                (case-insensitive)
//   fn       = "f" 1..24
//   char     = one printable ASCII character
//
// Examples: "ctrl-b n", "@any", "shift-g", "G", "ctrl-alt-shift-f1".

// `position` is the zero-based character offset into the full input text of
// the first unexpected token. Callers (including the keymap_gen build tool)
// surface position and message verbatim.
struct ParseError
{
    std::size_t position = 0;
    std::string message;

    std::string ToString() const;
};

// Parses one key (no whitespace allowed). Returns false and fills `err` on failure.
bool ParseKeySpec(std::string_view text, KeySpec& out, ParseError& err);

// Parses a whitespace-separated key sequence. The result is never empty on success.
bool ParseSequence(std::string_view text, Sequence& out, ParseError& err);

} // namespace keychord
