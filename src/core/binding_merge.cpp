#include "core/binding_merge.h"

#include <string>
#include <unordered_map>
#include <unordered_set>

namespace keychord
{
namespace
{
static bool CheckUniqueActions(const std::vector<Binding>& bindings, BuildError& err)
{
    std::unordered_set<std::string> seen;
    seen.reserve(bindings.size());
    for (const auto& b : bindings)
    {
        if (!seen.insert(b.action).second)
        {
            err.kind = BuildError::Kind::DuplicateAction;
            err.action = b.action;
            return false;
        }
    }
    return true;
}
} // namespace

std::vector<Binding> MergeDefaultsWithFile(const std::vector<Binding>& derived, const std::vector<Binding>& file)
{
    std::vector<Binding> merged = derived;
    std::unordered_map<std::string, size_t> idx;
    idx.reserve(merged.size());
    for (size_t i = 0; i < merged.size(); ++i)
        idx.emplace(merged[i].action, i);

    for (const auto& fb : file)
    {
        auto it = idx.find(fb.action);
        if (it == idx.end())
        {
            merged.push_back(fb);
            idx.emplace(fb.action, merged.size() - 1);
            continue;
        }

        Binding& dst = merged[it->second];
        dst.keys = fb.keys;
        dst.description = fb.description;
    }

    return merged;
}

std::shared_ptr<const BindingTable> MergeBindings(const std::vector<Binding>& derived,
                                                  const std::optional<std::vector<Binding>>& file,
                                                  BuildError& err)
{
    err = BuildError{};
    if (!CheckUniqueActions(derived, err))
        return nullptr;
    if (!file.has_value())
        return BindingTable::FromBindings(derived, err);

    if (!CheckUniqueActions(*file, err))
        return nullptr;
    return BindingTable::FromBindings(MergeDefaultsWithFile(derived, *file), err);
}

} // namespace keychord
