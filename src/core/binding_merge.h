#pragma once

#include "core/binding_table.h"

#include <memory>
#include <optional>
#include <vector>

namespace keychord
{
// Two-tier binding merge: a derived set (defaults declared in code, usually
// generated by keymap_gen) and a file set (user overrides).
//
// Per action:
// - only in derived -> kept unchanged
// - only in file    -> appended, in file order
// - in both         -> the file entry replaces keys AND description wholesale
//
// The result is validated like any other binding list, across all actions
// regardless of origin.
std::vector<Binding> MergeDefaultsWithFile(const std::vector<Binding>& derived, const std::vector<Binding>& file);

// Builds the merged table. `file` may be absent (defaults only).
// Fails with DuplicateAction if either source lists an action twice.
std::shared_ptr<const BindingTable> MergeBindings(const std::vector<Binding>& derived,
                                                  const std::optional<std::vector<Binding>>& file,
                                                  BuildError& err);

} // namespace keychord
