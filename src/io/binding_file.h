#pragma once

#include "core/binding_table.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace keychord::io
{
// Key binding files (JSON, schema_version = 1).
//
//   { "schema_version": 1,
//     "actions": [ { "id": "quit", "keys": ["q", "esc"], "description": "Quit" } ] }
//
// Also accepted:
// - a flat map:  { "quit": { "keys": ["q"], "description": "Quit" } }
// - modes:       { "schema_version": 1, "modes": { "home": <either form>, "edit": ... } }
//
// Key text is NOT parsed here; that happens when a BindingTable is built.

// Bindings without a "modes" section land in this mode.
inline constexpr const char* kDefaultMode = "default";

using BindingModes = std::map<std::string, std::vector<Binding>>;

struct LoadError
{
    enum class Kind : std::uint8_t
    {
        None = 0,
        Io,     // file could not be opened
        Syntax, // JSON library rejected the text; message is passed through as-is
        Schema, // valid JSON, wrong shape
    };

    Kind        kind = Kind::None;
    std::string message;
};

bool ParseBindingsJson(const std::string& text, BindingModes& out, LoadError& err);
bool LoadBindingsFile(const std::string& path, BindingModes& out, LoadError& err);

// Writes the "actions" form when only the default mode is present, the
// "modes" form otherwise. Output is indented by two spaces.
std::string SerializeBindings(const BindingModes& modes);
bool SaveBindingsFile(const std::string& path, const BindingModes& modes, std::string& err);

} // namespace keychord::io
