#include "core/key_groups.h"

namespace keychord
{
namespace
{
struct KeyView
{
    Mods mods;
    bool is_char = false;
    char ch = 0;
};

static bool IsLower(char c) { return c >= 'a' && c <= 'z'; }
static bool IsUpper(char c) { return c >= 'A' && c <= 'Z'; }
static bool IsDigit(char c) { return c >= '0' && c <= '9'; }

static char Upper(char c)
{
    return IsLower(c) ? (char)(c - 'a' + 'A') : c;
}

// Ways of reading a normalized concrete key, most literal first.
// shift-b is seen as (shift, 'B'), (shift, 'b') and (none, 'B').
static int Views(const KeySpec& k, KeyView out[3])
{
    KeyView base;
    base.mods = k.mods;
    base.is_char = k.atom.IsChar();
    base.ch = base.is_char ? k.atom.ch : 0;

    if (!base.is_char || !k.mods.shift || !IsLower(base.ch))
    {
        out[0] = base;
        return 1;
    }

    KeyView shifted = base;
    shifted.ch = Upper(base.ch);
    KeyView unshifted = shifted;
    unshifted.mods.shift = false;

    out[0] = shifted;
    out[1] = base;
    out[2] = unshifted;
    return 3;
}

// The character a user actually typed for this key.
static std::optional<char> TypedChar(const KeySpec& k)
{
    if (!k.atom.IsChar())
        return std::nullopt;
    if (k.mods.shift)
        return Upper(k.atom.ch);
    return k.atom.ch;
}
} // namespace

bool GroupMatchesChar(GroupKind group, char c)
{
    switch (group)
    {
        case GroupKind::Upper: return IsUpper(c);
        case GroupKind::Lower: return IsLower(c);
        case GroupKind::Alpha: return IsUpper(c) || IsLower(c);
        case GroupKind::Alnum: return IsUpper(c) || IsLower(c) || IsDigit(c);
        case GroupKind::Digit: return IsDigit(c);
        case GroupKind::Any: return true;
    }
    return false;
}

bool GroupMatches(GroupKind group, const KeySpec& concrete)
{
    if (group == GroupKind::Any)
        return true;
    const std::optional<char> c = TypedChar(concrete);
    return c.has_value() && GroupMatchesChar(group, *c);
}

std::optional<char> GroupCapture(GroupKind group, const KeySpec& concrete)
{
    if (!GroupMatches(group, concrete))
        return std::nullopt;
    return TypedChar(concrete);
}

bool MatchGroupPattern(const KeySpec& pattern, const KeySpec& concrete, std::optional<char>& capture)
{
    capture.reset();
    if (!pattern.atom.IsGroup())
        return false;

    const GroupKind group = pattern.atom.group;
    if (group == GroupKind::Any && pattern.mods.Empty())
    {
        capture = TypedChar(concrete);
        return true;
    }

    KeyView views[3];
    const int n = Views(concrete, views);
    for (int i = 0; i < n; ++i)
    {
        const KeyView& v = views[i];
        if (v.mods != pattern.mods)
            continue;
        if (group == GroupKind::Any)
        {
            if (v.is_char)
                capture = v.ch;
            return true;
        }
        if (v.is_char && GroupMatchesChar(group, v.ch))
        {
            capture = v.ch;
            return true;
        }
    }
    return false;
}

int GroupRank(GroupKind group)
{
    switch (group)
    {
        case GroupKind::Digit:
        case GroupKind::Lower:
        case GroupKind::Upper: return 0;
        case GroupKind::Alpha: return 1;
        case GroupKind::Alnum: return 2;
        case GroupKind::Any: return 3;
    }
    return 3;
}

} // namespace keychord
