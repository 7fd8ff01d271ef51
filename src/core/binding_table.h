#pragma once

#include "core/key_parser.h"
#include "core/key_spec.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keychord
{
// One action with 1+ key patterns, as declared in code or loaded from a file.
struct Binding
{
    std::string              action;      // stable id, e.g. "quit" or "app.file.new"
    std::vector<std::string> keys;        // key text, e.g. "ctrl-b n", "@digit"
    std::string              description; // optional help text
};

struct DuplicatePattern
{
    std::string pattern;  // canonical key text
    std::string action_a; // earlier owner (table order)
    std::string action_b;
};

struct BuildError
{
    enum class Kind : std::uint8_t
    {
        None = 0,
        Parse,
        DuplicatePattern,
        NoPatterns,
        DuplicateAction,
    };

    Kind             kind = Kind::None;
    std::string      action;  // action being built when the error occurred
    std::string      pattern; // offending key text as written (Parse)
    ParseError       parse;
    DuplicatePattern duplicate;

    std::string Message() const;
};

// Result of resolving keys against a table.
struct Resolution
{
    std::string         action;
    std::string         description;
    std::optional<char> captured; // first group capture along the path
    std::vector<char>   captures; // every group capture, in key order
    bool                exact = true; // no group pattern was involved
};

// Immutable action <-> pattern table.
//
// Built once from a binding list; every key text is parsed and normalized, and
// no two actions may claim the same normalized sequence. Lookups prefer literal
// patterns over group patterns at every step.
//
// Safe to share read-only across threads.
class BindingTable
{
public:
    // Returns nullptr and fills `err` on failure.
    static std::shared_ptr<const BindingTable> FromBindings(std::vector<Binding> bindings, BuildError& err);

    ~BindingTable();
    BindingTable(const BindingTable&) = delete;
    BindingTable& operator=(const BindingTable&) = delete;

    const std::vector<Binding>& Bindings() const { return bindings_; }
    size_t Size() const { return bindings_.size(); }

    const Binding* Find(std::string_view action) const;

    // Parsed patterns for an action in Binding::keys order (repeated spellings
    // of one key kept once), or nullptr.
    const std::vector<Sequence>* PatternsFor(std::string_view action) const;

    // Exact owner of a normalized pattern (no group matching).
    std::optional<std::string> ActionForPattern(const Sequence& pattern) const;

    // Single-key lookups.
    std::optional<std::string> Lookup(const KeySpec& key) const;
    std::optional<Resolution> LookupBound(const KeySpec& key) const;

    // Whole-sequence lookups.
    std::optional<Resolution> LookupSequence(const Sequence& keys) const;
    std::optional<Resolution> LookupText(std::string_view text) const;

    // True when `keys` is a strict prefix of at least one registered pattern.
    bool IsPrefix(const Sequence& keys) const;

    // Same, but only following literal (non-group) pattern steps.
    bool IsLiteralPrefix(const Sequence& keys) const;

private:
    struct Node;

    BindingTable();

    static void SortGroupEdges(Node& node);
    bool Search(const Node& node, const Sequence& keys, size_t pos, Resolution& out, size_t& out_index) const;
    bool PrefixSearch(const Node& node, const Sequence& keys, size_t pos, bool literal_only) const;

    std::vector<Binding>                    bindings_;
    std::vector<std::vector<Sequence>>      patterns_;
    std::unordered_map<std::string, size_t> action_index_;
    std::unordered_map<std::string, size_t> pattern_owner_; // canonical text -> binding index
    std::unique_ptr<Node>                   root_;
};

} // namespace keychord
