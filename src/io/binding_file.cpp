#include "io/binding_file.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace keychord::io
{
namespace
{
// Top-level keys that are metadata in the flat-map form, never action ids.
static bool IsReservedKey(const std::string& k)
{
    return k == "schema_version" || k == "name" || k == "description" || k == "notes";
}

static bool KeysFromJson(const json& jk, std::vector<std::string>& out, std::string& err)
{
    out.clear();
    if (jk.is_string())
    {
        out.push_back(jk.get<std::string>());
        return true;
    }
    if (!jk.is_array())
    {
        err = "'keys' must be a string or an array of strings";
        return false;
    }
    for (const auto& k : jk)
    {
        if (!k.is_string())
        {
            err = "'keys' entries must be strings";
            return false;
        }
        out.push_back(k.get<std::string>());
    }
    return true;
}

// `id` is empty for array entries (read from the object) and set for flat-map entries.
static bool BindingFromJson(const json& ja, const std::string& id, Binding& out, std::string& err)
{
    err.clear();
    if (!ja.is_object())
    {
        err = id.empty() ? "action is not an object" : "action '" + id + "' is not an object";
        return false;
    }

    out = Binding{};
    if (!id.empty())
    {
        out.action = id;
    }
    else
    {
        if (!ja.contains("id") || !ja["id"].is_string())
        {
            err = "action missing string 'id'";
            return false;
        }
        out.action = ja["id"].get<std::string>();
    }

    if (!ja.contains("keys"))
    {
        err = "action '" + out.action + "' missing 'keys'";
        return false;
    }
    std::string kerr;
    if (!KeysFromJson(ja["keys"], out.keys, kerr))
    {
        err = "action '" + out.action + "': " + kerr;
        return false;
    }

    if (ja.contains("description") && ja["description"].is_string())
        out.description = ja["description"].get<std::string>();
    return true;
}

static bool ModeFromJson(const json& jm, std::vector<Binding>& out, std::string& err)
{
    out.clear();

    const json* actions = nullptr;
    if (jm.is_array())
        actions = &jm;
    else if (jm.is_object() && jm.contains("actions"))
    {
        if (!jm["actions"].is_array())
        {
            err = "'actions' must be an array";
            return false;
        }
        actions = &jm["actions"];
    }

    if (actions)
    {
        for (const auto& ja : *actions)
        {
            Binding b;
            if (!BindingFromJson(ja, std::string(), b, err))
                return false;
            out.push_back(std::move(b));
        }
        return true;
    }

    if (!jm.is_object())
    {
        err = "bindings must be an object or an array";
        return false;
    }

    // nlohmann::json sorts object keys, so flat-map order is alphabetical.
    for (auto it = jm.begin(); it != jm.end(); ++it)
    {
        if (IsReservedKey(it.key()))
            continue;
        Binding b;
        if (!BindingFromJson(it.value(), it.key(), b, err))
            return false;
        out.push_back(std::move(b));
    }
    return true;
}

static json BindingToJson(const Binding& b)
{
    json ja;
    ja["id"] = b.action;
    ja["keys"] = b.keys;
    if (!b.description.empty())
        ja["description"] = b.description;
    return ja;
}

static json ModeToJson(const std::vector<Binding>& bindings)
{
    json actions = json::array();
    for (const auto& b : bindings)
        actions.push_back(BindingToJson(b));
    return actions;
}

static void SetSchema(LoadError& err, std::string message)
{
    err.kind = LoadError::Kind::Schema;
    err.message = std::move(message);
}
} // namespace

bool ParseBindingsJson(const std::string& text, BindingModes& out, LoadError& err)
{
    err = LoadError{};
    out.clear();

    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const std::exception& e)
    {
        err.kind = LoadError::Kind::Syntax;
        err.message = e.what();
        return false;
    }

    if (!j.is_object())
    {
        SetSchema(err, "key bindings root must be an object");
        return false;
    }
    if (j.contains("schema_version"))
    {
        if (!j["schema_version"].is_number_integer())
        {
            SetSchema(err, "'schema_version' must be an integer");
            return false;
        }
        if (j["schema_version"].get<std::int64_t>() != 1)
        {
            SetSchema(err, "Unsupported key-bindings schema_version (expected 1)");
            return false;
        }
    }

    std::string merr;
    if (j.contains("modes"))
    {
        if (!j["modes"].is_object())
        {
            SetSchema(err, "'modes' must be an object");
            return false;
        }
        for (auto it = j["modes"].begin(); it != j["modes"].end(); ++it)
        {
            std::vector<Binding> bindings;
            if (!ModeFromJson(it.value(), bindings, merr))
            {
                SetSchema(err, "mode '" + it.key() + "': " + merr);
                out.clear();
                return false;
            }
            out[it.key()] = std::move(bindings);
        }
        return true;
    }

    std::vector<Binding> bindings;
    if (!ModeFromJson(j, bindings, merr))
    {
        SetSchema(err, merr);
        return false;
    }
    out[kDefaultMode] = std::move(bindings);
    return true;
}

bool LoadBindingsFile(const std::string& path, BindingModes& out, LoadError& err)
{
    std::ifstream f(path);
    if (!f)
    {
        out.clear();
        err.kind = LoadError::Kind::Io;
        err.message = std::string("Could not open '") + path + "'";
        return false;
    }

    std::stringstream ss;
    ss << f.rdbuf();
    return ParseBindingsJson(ss.str(), out, err);
}

std::string SerializeBindings(const BindingModes& modes)
{
    json j;
    j["schema_version"] = 1;

    const auto def = modes.find(kDefaultMode);
    if (modes.empty() || (modes.size() == 1 && def != modes.end()))
    {
        j["actions"] = def != modes.end() ? ModeToJson(def->second) : json::array();
        return j.dump(2);
    }

    json jm = json::object();
    for (const auto& [name, bindings] : modes)
    {
        json mode;
        mode["actions"] = ModeToJson(bindings);
        jm[name] = std::move(mode);
    }
    j["modes"] = std::move(jm);
    return j.dump(2);
}

bool SaveBindingsFile(const std::string& path, const BindingModes& modes, std::string& err)
{
    err.clear();

    std::string text;
    try
    {
        text = SerializeBindings(modes);
    }
    catch (const std::exception& e)
    {
        // dump() throws on invalid UTF-8 in ids or descriptions.
        err = std::string("Failed to write JSON: ") + e.what();
        return false;
    }

    std::ofstream out(path);
    if (!out)
    {
        err = "Failed to open file for writing.";
        return false;
    }
    out << text << "\n";
    if (!out)
    {
        err = "Failed to write file.";
        return false;
    }
    return true;
}

} // namespace keychord::io
