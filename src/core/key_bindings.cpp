#include "core/key_bindings.h"

#include "core/binding_merge.h"

#include <cstdio>
#include <utility>

namespace keychord
{
KeyBindingsEngine::KeyBindingsEngine()
    : matcher_(nullptr)
{
    std::string err;
    if (!SetDefaults({}, err))
        std::fprintf(stderr, "[keybinds] %s\n", err.c_str());
}

bool KeyBindingsEngine::Fail(std::string message, std::string& out_error)
{
    last_error_ = std::move(message);
    out_error = last_error_;
    std::fprintf(stderr, "[keybinds] %s\n", last_error_.c_str());
    return false;
}

bool KeyBindingsEngine::Install(ModeMap modes, std::string& out_error)
{
    for (auto& [name, st] : modes)
    {
        BuildError berr;
        st.table = MergeBindings(st.defaults, st.file, berr);
        if (!st.table)
            return Fail("mode '" + name + "': " + berr.Message(), out_error);
    }

    modes_ = std::move(modes);
    if (modes_.find(mode_) == modes_.end())
        mode_ = io::kDefaultMode;
    if (modes_.find(mode_) == modes_.end())
        mode_ = modes_.empty() ? std::string(io::kDefaultMode) : modes_.begin()->first;

    matcher_.SetTable(Table());
    last_error_.clear();
    return true;
}

bool KeyBindingsEngine::SetDefaults(std::vector<Binding> defaults, std::string& out_error)
{
    return SetModeDefaults(io::kDefaultMode, std::move(defaults), out_error);
}

bool KeyBindingsEngine::SetModeDefaults(const std::string& mode, std::vector<Binding> defaults,
                                        std::string& out_error)
{
    out_error.clear();
    ModeMap next = modes_;
    next[mode].defaults = std::move(defaults);
    return Install(std::move(next), out_error);
}

bool KeyBindingsEngine::ApplyFile(const io::BindingModes& file, std::string& out_error)
{
    ModeMap next = modes_;
    for (auto& it : next)
        it.second.file.reset();
    for (const auto& [name, bindings] : file)
        next[name].file = bindings;

    if (!Install(std::move(next), out_error))
        return false;
    loaded_ = true;
    return true;
}

bool KeyBindingsEngine::LoadFromFile(const std::string& path, std::string& out_error)
{
    out_error.clear();
    path_ = path;

    io::BindingModes file;
    io::LoadError    lerr;
    if (!io::LoadBindingsFile(path, file, lerr))
    {
        if (lerr.kind != io::LoadError::Kind::Io)
            return Fail(path + ": " + lerr.message, out_error);

        // Missing file: defaults only, so the user can save a fresh copy.
        std::string rerr;
        if (!ResetToDefaults(rerr))
            return Fail(rerr, out_error);
        loaded_ = true;
        return Fail(lerr.message + ". Using defaults (not saved yet).", out_error);
    }

    if (!ApplyFile(file, out_error))
        return false;
    std::fprintf(stderr, "[keybinds] loaded %s (%zu mode(s))\n", path.c_str(), file.size());
    return true;
}

bool KeyBindingsEngine::LoadFromString(const std::string& text, std::string& out_error)
{
    out_error.clear();

    io::BindingModes file;
    io::LoadError    lerr;
    if (!io::ParseBindingsJson(text, file, lerr))
        return Fail(lerr.message, out_error);
    return ApplyFile(file, out_error);
}

bool KeyBindingsEngine::ResetToDefaults(std::string& out_error)
{
    out_error.clear();
    ModeMap next = modes_;
    for (auto it = next.begin(); it != next.end();)
    {
        // Modes that only existed in the file go away with it.
        if (it->second.defaults.empty() && it->first != io::kDefaultMode)
            it = next.erase(it);
        else
        {
            it->second.file.reset();
            ++it;
        }
    }
    return Install(std::move(next), out_error);
}

bool KeyBindingsEngine::SaveToFile(const std::string& path, std::string& out_error) const
{
    out_error.clear();

    io::BindingModes out;
    for (const auto& [name, st] : modes_)
    {
        if (st.table)
            out[name] = st.table->Bindings();
    }

    if (!io::SaveBindingsFile(path, out, out_error))
    {
        std::fprintf(stderr, "[keybinds] save %s failed: %s\n", path.c_str(), out_error.c_str());
        return false;
    }
    return true;
}

bool KeyBindingsEngine::SetMode(const std::string& mode)
{
    if (modes_.find(mode) == modes_.end())
        return false;
    if (mode == mode_)
        return true;
    mode_ = mode;
    matcher_.SetTable(Table());
    return true;
}

std::vector<std::string> KeyBindingsEngine::Modes() const
{
    std::vector<std::string> out;
    out.reserve(modes_.size());
    for (const auto& it : modes_)
        out.push_back(it.first);
    return out;
}

std::shared_ptr<const BindingTable> KeyBindingsEngine::TableFor(const std::string& mode) const
{
    const auto it = modes_.find(mode);
    if (it == modes_.end())
        return nullptr;
    return it->second.table;
}

std::shared_ptr<const BindingTable> KeyBindingsEngine::Table() const
{
    return TableFor(mode_);
}

MatchOutcome KeyBindingsEngine::Feed(const KeySpec& key, Clock::time_point now)
{
    return matcher_.Feed(key, now);
}

bool KeyBindingsEngine::ActionPressed(std::string_view action_id, const KeySpec& key) const
{
    const std::shared_ptr<const BindingTable> table = Table();
    if (!table)
        return false;
    const std::optional<std::string> action = table->Lookup(key);
    return action.has_value() && *action == action_id;
}

} // namespace keychord
