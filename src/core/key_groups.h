#pragma once

#include "core/key_spec.h"

#include <optional>

namespace keychord
{
// Key groups ("@upper", "@digit", ...) are semantic classes over concrete keys.
//
// Concrete keys are normalized, so an uppercase letter arrives as shift + lowercase.
// Group tests see it as the uppercase character again: "A" satisfies @upper and
// @alpha, and is captured as 'A'.

// ASCII class test for a single character.
bool GroupMatchesChar(GroupKind group, char c);

// Modifiers are ignored here. @any matches every key (named keys included);
// every other group requires a character key.
bool GroupMatches(GroupKind group, const KeySpec& concrete);

// The character that satisfied the group, when the concrete key is a character.
std::optional<char> GroupCapture(GroupKind group, const KeySpec& concrete);

// Matches a group pattern (modifiers + group atom) against a concrete key,
// modifiers included. A bare "@any" accepts any modifiers. On success the
// captured character is stored in `capture` (nullopt for named keys).
bool MatchGroupPattern(const KeySpec& pattern, const KeySpec& concrete, std::optional<char>& capture);

// Lower rank = narrower group = tried first.
int GroupRank(GroupKind group);

} // namespace keychord
