#include "core/binding_table.h"

#include "core/key_groups.h"

#include <algorithm>
#include <map>
#include <utility>

namespace keychord
{
// Pattern trie. Literal steps are keyed by packed KeySpec; group steps are kept
// in priority order and tried only after the literal child failed.
struct BindingTable::Node
{
    struct GroupEdge
    {
        KeySpec               key;
        size_t                order = 0;
        std::unique_ptr<Node> child;
    };

    std::optional<size_t>                          binding;
    std::map<std::uint32_t, std::unique_ptr<Node>> exact;
    std::vector<GroupEdge>                         groups;

    bool HasChildren() const { return !exact.empty() || !groups.empty(); }
};

void BindingTable::SortGroupEdges(Node& node)
{
    std::stable_sort(node.groups.begin(), node.groups.end(), [](const Node::GroupEdge& a, const Node::GroupEdge& b) {
        const int ra = GroupRank(a.key.atom.group);
        const int rb = GroupRank(b.key.atom.group);
        if (ra != rb)
            return ra < rb;
        const int ma = a.key.mods.Count();
        const int mb = b.key.mods.Count();
        if (ma != mb)
            return ma > mb;
        return a.order < b.order;
    });

    for (auto& it : node.exact)
        SortGroupEdges(*it.second);
    for (auto& e : node.groups)
        SortGroupEdges(*e.child);
}

std::string BuildError::Message() const
{
    switch (kind)
    {
        case Kind::None: return std::string();
        case Kind::Parse:
            return "action '" + action + "': key \"" + pattern + "\": " + parse.ToString();
        case Kind::DuplicatePattern:
            return "key \"" + duplicate.pattern + "\" is bound to both '" + duplicate.action_a + "' and '" +
                   duplicate.action_b + "'";
        case Kind::NoPatterns:
            return "action '" + action + "' has no keys";
        case Kind::DuplicateAction:
            return "action '" + action + "' is listed more than once";
    }
    return std::string();
}

BindingTable::BindingTable() = default;
BindingTable::~BindingTable() = default;

std::shared_ptr<const BindingTable> BindingTable::FromBindings(std::vector<Binding> bindings, BuildError& err)
{
    err = BuildError{};

    std::shared_ptr<BindingTable> table(new BindingTable());
    table->bindings_ = std::move(bindings);
    table->root_ = std::make_unique<Node>();
    table->patterns_.resize(table->bindings_.size());
    table->action_index_.reserve(table->bindings_.size());

    size_t group_order = 0;
    for (size_t i = 0; i < table->bindings_.size(); ++i)
    {
        const Binding& b = table->bindings_[i];
        if (!table->action_index_.emplace(b.action, i).second)
        {
            err.kind = BuildError::Kind::DuplicateAction;
            err.action = b.action;
            return nullptr;
        }
        if (b.keys.empty())
        {
            err.kind = BuildError::Kind::NoPatterns;
            err.action = b.action;
            return nullptr;
        }

        for (const std::string& text : b.keys)
        {
            Sequence seq;
            ParseError perr;
            if (!ParseSequence(text, seq, perr))
            {
                err.kind = BuildError::Kind::Parse;
                err.action = b.action;
                err.pattern = text;
                err.parse = perr;
                return nullptr;
            }

            const std::string canonical = ToString(seq);
            const auto [owner, inserted] = table->pattern_owner_.emplace(canonical, i);
            if (!inserted)
            {
                if (owner->second == i)
                    continue; // same action spelled the same key twice ("esc", "escape")
                err.kind = BuildError::Kind::DuplicatePattern;
                err.action = b.action;
                err.pattern = text;
                err.duplicate.pattern = canonical;
                err.duplicate.action_a = table->bindings_[owner->second].action;
                err.duplicate.action_b = b.action;
                return nullptr;
            }

            Node* node = table->root_.get();
            for (const KeySpec& k : seq)
            {
                if (k.atom.IsGroup())
                {
                    auto it = std::find_if(node->groups.begin(), node->groups.end(),
                                           [&](const Node::GroupEdge& e) { return e.key == k; });
                    if (it == node->groups.end())
                    {
                        Node::GroupEdge edge;
                        edge.key = k;
                        edge.order = group_order++;
                        edge.child = std::make_unique<Node>();
                        node->groups.push_back(std::move(edge));
                        it = node->groups.end() - 1;
                    }
                    node = it->child.get();
                }
                else
                {
                    std::unique_ptr<Node>& child = node->exact[k.Packed()];
                    if (!child)
                        child = std::make_unique<Node>();
                    node = child.get();
                }
            }
            node->binding = i;
            table->patterns_[i].push_back(std::move(seq));
        }
    }

    SortGroupEdges(*table->root_);
    return table;
}

const Binding* BindingTable::Find(std::string_view action) const
{
    const auto it = action_index_.find(std::string(action));
    if (it == action_index_.end())
        return nullptr;
    return &bindings_[it->second];
}

const std::vector<Sequence>* BindingTable::PatternsFor(std::string_view action) const
{
    const auto it = action_index_.find(std::string(action));
    if (it == action_index_.end())
        return nullptr;
    return &patterns_[it->second];
}

std::optional<std::string> BindingTable::ActionForPattern(const Sequence& pattern) const
{
    const auto it = pattern_owner_.find(ToString(pattern));
    if (it == pattern_owner_.end())
        return std::nullopt;
    return bindings_[it->second].action;
}

bool BindingTable::Search(const Node& node, const Sequence& keys, size_t pos, Resolution& out, size_t& out_index) const
{
    if (pos == keys.size())
    {
        if (!node.binding.has_value())
            return false;
        out_index = *node.binding;
        return true;
    }

    const KeySpec& k = keys[pos];

    // 1. Literal step.
    const auto it = node.exact.find(k.Packed());
    if (it != node.exact.end() && Search(*it->second, keys, pos + 1, out, out_index))
        return true;

    // 2. Group steps, narrowest first.
    for (const auto& edge : node.groups)
    {
        std::optional<char> cap;
        if (!MatchGroupPattern(edge.key, k, cap))
            continue;

        const size_t mark = out.captures.size();
        const bool   was_exact = out.exact;
        if (cap.has_value())
            out.captures.push_back(*cap);
        out.exact = false;

        if (Search(*edge.child, keys, pos + 1, out, out_index))
            return true;

        out.captures.resize(mark);
        out.exact = was_exact;
    }
    return false;
}

bool BindingTable::PrefixSearch(const Node& node, const Sequence& keys, size_t pos, bool literal_only) const
{
    if (pos == keys.size())
        return node.HasChildren();

    const KeySpec& k = keys[pos];
    const auto it = node.exact.find(k.Packed());
    if (it != node.exact.end() && PrefixSearch(*it->second, keys, pos + 1, literal_only))
        return true;

    if (literal_only)
        return false;

    for (const auto& edge : node.groups)
    {
        std::optional<char> cap;
        if (MatchGroupPattern(edge.key, k, cap) && PrefixSearch(*edge.child, keys, pos + 1, literal_only))
            return true;
    }
    return false;
}

std::optional<Resolution> BindingTable::LookupSequence(const Sequence& keys) const
{
    if (keys.empty())
        return std::nullopt;

    Sequence normalized;
    normalized.reserve(keys.size());
    for (const KeySpec& k : keys)
        normalized.push_back(Normalize(k));

    Resolution r;
    size_t     index = 0;
    if (!Search(*root_, normalized, 0, r, index))
        return std::nullopt;

    r.action = bindings_[index].action;
    r.description = bindings_[index].description;
    if (!r.captures.empty())
        r.captured = r.captures.front();
    return r;
}

std::optional<Resolution> BindingTable::LookupBound(const KeySpec& key) const
{
    return LookupSequence(Sequence{key});
}

std::optional<std::string> BindingTable::Lookup(const KeySpec& key) const
{
    std::optional<Resolution> r = LookupBound(key);
    if (!r.has_value())
        return std::nullopt;
    return std::move(r->action);
}

std::optional<Resolution> BindingTable::LookupText(std::string_view text) const
{
    Sequence   keys;
    ParseError perr;
    if (!ParseSequence(text, keys, perr))
        return std::nullopt;
    return LookupSequence(keys);
}

bool BindingTable::IsPrefix(const Sequence& keys) const
{
    return !keys.empty() && PrefixSearch(*root_, keys, 0, false);
}

bool BindingTable::IsLiteralPrefix(const Sequence& keys) const
{
    return !keys.empty() && PrefixSearch(*root_, keys, 0, true);
}

} // namespace keychord
