#include "core/key_spec.h"

namespace keychord
{
namespace
{
struct NamedKeyEntry
{
    const char* name;
    NamedKey    key;
};

// First entry for each key is its canonical spelling.
static const NamedKeyEntry kNamedKeys[] = {
    {"backspace", NamedKey::Backspace},
    {"enter", NamedKey::Enter},
    {"return", NamedKey::Enter},
    {"esc", NamedKey::Esc},
    {"escape", NamedKey::Esc},
    {"tab", NamedKey::Tab},
    {"backtab", NamedKey::BackTab},
    {"space", NamedKey::Space},
    {"delete", NamedKey::Delete},
    {"del", NamedKey::Delete},
    {"insert", NamedKey::Insert},
    {"ins", NamedKey::Insert},
    {"home", NamedKey::Home},
    {"end", NamedKey::End},
    {"pageup", NamedKey::PageUp},
    {"pgup", NamedKey::PageUp},
    {"pagedown", NamedKey::PageDown},
    {"pgdn", NamedKey::PageDown},
    {"up", NamedKey::Up},
    {"down", NamedKey::Down},
    {"left", NamedKey::Left},
    {"right", NamedKey::Right},
};

static const char* kGroupNames[] = {"upper", "lower", "alpha", "alnum", "digit", "any"};
} // namespace

std::uint32_t KeySpec::Packed() const
{
    std::uint32_t payload = 0;
    switch (atom.kind)
    {
        case KeyAtom::Kind::Char: payload = (unsigned char)atom.ch; break;
        case KeyAtom::Kind::Named:
            payload = ((std::uint32_t)atom.named << 8) | (atom.named == NamedKey::F ? atom.fn : 0u);
            break;
        case KeyAtom::Kind::Group: payload = (std::uint32_t)atom.group; break;
    }
    return ((std::uint32_t)atom.kind << 24) | (payload << 8) | mods.Bits();
}

KeySpec Normalize(KeySpec key)
{
    if (key.atom.kind != KeyAtom::Kind::Char)
        return key;

    const char c = key.atom.ch;
    if (c >= 'A' && c <= 'Z')
    {
        key.mods.shift = true;
        key.atom.ch = (char)(c - 'A' + 'a');
    }
    else if (c == ' ')
    {
        key.atom = KeyAtom::Named(NamedKey::Space);
    }
    return key;
}

KeySpec CharKey(char c, Mods mods)
{
    return Normalize(KeySpec{mods, KeyAtom::Char(c)});
}

KeySpec NamedKeySpec(NamedKey k, Mods mods)
{
    return KeySpec{mods, KeyAtom::Named(k)};
}

KeySpec FunctionKeySpec(int n, Mods mods)
{
    return KeySpec{mods, KeyAtom::Function(n)};
}

std::string ToString(const Mods& mods)
{
    std::string s;
    if (mods.ctrl) s += "ctrl-";
    if (mods.alt) s += "alt-";
    if (mods.shift) s += "shift-";
    if (mods.cmd) s += "cmd-";
    return s;
}

std::string ToString(const KeySpec& key)
{
    std::string s = ToString(key.mods);
    switch (key.atom.kind)
    {
        case KeyAtom::Kind::Char:
            s.push_back(key.atom.ch);
            break;
        case KeyAtom::Kind::Named:
            if (key.atom.named == NamedKey::F)
                s += "f" + std::to_string((int)key.atom.fn);
            else
                s += NamedKeyName(key.atom.named);
            break;
        case KeyAtom::Kind::Group:
            s += "@";
            s += GroupName(key.atom.group);
            break;
    }
    return s;
}

std::string ToString(const Sequence& seq)
{
    std::string s;
    for (size_t i = 0; i < seq.size(); ++i)
    {
        if (i > 0)
            s.push_back(' ');
        s += ToString(seq[i]);
    }
    return s;
}

const char* NamedKeyName(NamedKey k)
{
    if (k == NamedKey::F)
        return "f";
    for (const auto& e : kNamedKeys)
    {
        if (e.key == k)
            return e.name;
    }
    return "?";
}

bool NamedKeyFromName(std::string_view lower, NamedKey& out)
{
    for (const auto& e : kNamedKeys)
    {
        if (lower == e.name)
        {
            out = e.key;
            return true;
        }
    }
    return false;
}

const char* GroupName(GroupKind g)
{
    const size_t i = (size_t)g;
    if (i < sizeof(kGroupNames) / sizeof(kGroupNames[0]))
        return kGroupNames[i];
    return "?";
}

bool GroupFromName(std::string_view name, GroupKind& out)
{
    for (size_t i = 0; i < sizeof(kGroupNames) / sizeof(kGroupNames[0]); ++i)
    {
        if (name == kGroupNames[i])
        {
            out = (GroupKind)i;
            return true;
        }
    }
    return false;
}

} // namespace keychord
