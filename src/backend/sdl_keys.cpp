#include "backend/sdl_keys.h"

namespace keychord::sdl
{
namespace
{
struct NamedKeycode
{
    NamedKey    key;
    SDL_Keycode code;
};

static const NamedKeycode kNamedKeycodes[] = {
    {NamedKey::Backspace, SDLK_BACKSPACE},
    {NamedKey::Enter, SDLK_RETURN},
    {NamedKey::Esc, SDLK_ESCAPE},
    {NamedKey::Tab, SDLK_TAB},
    {NamedKey::Space, SDLK_SPACE},
    {NamedKey::Delete, SDLK_DELETE},
    {NamedKey::Insert, SDLK_INSERT},
    {NamedKey::Home, SDLK_HOME},
    {NamedKey::End, SDLK_END},
    {NamedKey::PageUp, SDLK_PAGEUP},
    {NamedKey::PageDown, SDLK_PAGEDOWN},
    {NamedKey::Up, SDLK_UP},
    {NamedKey::Down, SDLK_DOWN},
    {NamedKey::Left, SDLK_LEFT},
    {NamedKey::Right, SDLK_RIGHT},
};

// F1..F12 and F13..F24 are two contiguous runs in SDL3.
static int FunctionNumber(SDL_Keycode key)
{
    if (key >= SDLK_F1 && key <= SDLK_F12)
        return (int)(key - SDLK_F1) + 1;
    if (key >= SDLK_F13 && key <= SDLK_F24)
        return (int)(key - SDLK_F13) + 13;
    return 0;
}

static SDL_Keycode FunctionKeycode(int n)
{
    if (n >= 1 && n <= 12)
        return (SDL_Keycode)(SDLK_F1 + (SDL_Keycode)(n - 1));
    if (n >= 13 && n <= 24)
        return (SDL_Keycode)(SDLK_F13 + (SDL_Keycode)(n - 13));
    return SDLK_UNKNOWN;
}
} // namespace

Mods ModsFromSdl(SDL_Keymod mod)
{
    Mods m;
    m.ctrl = (mod & SDL_KMOD_CTRL) != 0;
    m.alt = (mod & SDL_KMOD_ALT) != 0;
    m.shift = (mod & SDL_KMOD_SHIFT) != 0;
    m.cmd = (mod & SDL_KMOD_GUI) != 0;
    return m;
}

SDL_Keymod ModsToSdl(const Mods& mods)
{
    SDL_Keymod mod = SDL_KMOD_NONE;
    if (mods.ctrl) mod |= SDL_KMOD_LCTRL;
    if (mods.alt) mod |= SDL_KMOD_LALT;
    if (mods.shift) mod |= SDL_KMOD_LSHIFT;
    if (mods.cmd) mod |= SDL_KMOD_LGUI;
    return mod;
}

bool ToKeySpec(SDL_Keycode key, SDL_Keymod mod, KeySpec& out)
{
    Mods mods = ModsFromSdl(mod);

    if (key == SDLK_TAB && mods.shift)
    {
        mods.shift = false;
        out = NamedKeySpec(NamedKey::BackTab, mods);
        return true;
    }
    if (key == SDLK_KP_ENTER)
        key = SDLK_RETURN;

    for (const auto& nk : kNamedKeycodes)
    {
        if (nk.code == key)
        {
            out = NamedKeySpec(nk.key, mods);
            return true;
        }
    }

    if (const int fn = FunctionNumber(key); fn != 0)
    {
        out = FunctionKeySpec(fn, mods);
        return true;
    }

    if (key >= 0x21 && key <= 0x7e)
    {
        const char c = (char)key;
        const bool letter = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!letter)
            mods.shift = false;
        out = CharKey(c, mods);
        return true;
    }
    return false;
}

bool ToKeySpec(const SDL_KeyboardEvent& ev, KeySpec& out)
{
    return ToKeySpec(ev.key, ev.mod, out);
}

bool FromKeySpec(const KeySpec& spec, SDL_Keycode& key, SDL_Keymod& mod)
{
    const KeySpec k = Normalize(spec);
    mod = ModsToSdl(k.mods);

    switch (k.atom.kind)
    {
        case KeyAtom::Kind::Group:
            return false;
        case KeyAtom::Kind::Char:
            key = (SDL_Keycode)(unsigned char)k.atom.ch;
            return true;
        case KeyAtom::Kind::Named:
            break;
    }

    if (k.atom.named == NamedKey::BackTab)
    {
        key = SDLK_TAB;
        mod |= SDL_KMOD_LSHIFT;
        return true;
    }
    if (k.atom.named == NamedKey::F)
    {
        key = FunctionKeycode(k.atom.fn);
        return key != SDLK_UNKNOWN;
    }
    for (const auto& nk : kNamedKeycodes)
    {
        if (nk.key == k.atom.named)
        {
            key = nk.code;
            return true;
        }
    }
    return false;
}

} // namespace keychord::sdl
