#pragma once

#include "core/key_spec.h"

#include <SDL3/SDL.h>

namespace keychord::sdl
{
// SDL3 keyboard event <-> KeySpec.
//
// With SDL3's default keycode options the keycode already carries Shift for
// symbols (Shift+/ arrives as '?'), so Shift is dropped for printable
// non-letter keys: the result is "?" rather than "shift-?". Letters keep Shift
// whichever case SDL reports, so Shift+A is shift-a (== "A"). Shift+Tab
// becomes BackTab.
// Pure modifier presses, keypad-only keys and anything else with no KeySpec
// counterpart are rejected.

Mods ModsFromSdl(SDL_Keymod mod);
SDL_Keymod ModsToSdl(const Mods& mods);

bool ToKeySpec(SDL_Keycode key, SDL_Keymod mod, KeySpec& out);
bool ToKeySpec(const SDL_KeyboardEvent& ev, KeySpec& out);

// Fails for group atoms (they describe many keys, not one).
bool FromKeySpec(const KeySpec& spec, SDL_Keycode& key, SDL_Keymod& mod);

} // namespace keychord::sdl
