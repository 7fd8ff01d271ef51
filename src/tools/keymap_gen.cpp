#include "core/binding_table.h"
#include "core/key_parser.h"
#include "io/binding_file.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <declarations.json> <output.h> [options]\n"
              << "\n"
              << "Parses every key of every declared action and writes a C++ header with an\n"
              << "inline function returning the bindings as std::vector<keychord::Binding>, plus a\n"
              << "typed enum class Action, one struct per action under namespace action (actions\n"
              << "bound through a key group carry the captured char as `value`), the BoundAction\n"
              << "variant and Bind(const keychord::Resolution&).\n"
              << "Any key that fails to parse is reported with its position and nothing is written.\n"
              << "\n"
              << "Options:\n"
              << "  --namespace <ns>   Namespace of the generated function (default: keychord::defaults)\n"
              << "  --function <name>  Function name (default: DefaultBindings)\n"
              << "  --check            Validate only; do not write <output.h>\n";
}

// "  ctrl-x 1z\n         ^"
static void PrintCaret(std::string_view text, size_t pos)
{
    std::cerr << "    " << text << "\n    ";
    for (size_t i = 0; i < pos && i < text.size(); ++i)
        std::cerr << (text[i] == '\t' ? '\t' : ' ');
    std::cerr << "^\n";
}

// Octal escapes keep following characters from being read as part of the escape.
static std::string CppString(std::string_view s)
{
    std::string out = "\"";
    for (char c : s)
    {
        const unsigned char u = (unsigned char)c;
        if (c == '"' || c == '\\')
        {
            out += '\\';
            out += c;
        }
        else if (c == '\n')
            out += "\\n";
        else if (c == '\t')
            out += "\\t";
        else if (u < 0x20 || u == 0x7f)
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\%03o", (unsigned)u);
            out += buf;
        }
        else
            out += c;
    }
    out += '"';
    return out;
}

// Reports every unparsable key, not just the first.
static size_t CheckKeys(const std::string& file, const std::vector<keychord::Binding>& bindings)
{
    size_t failures = 0;
    for (const auto& b : bindings)
    {
        for (const std::string& text : b.keys)
        {
            keychord::Sequence   seq;
            keychord::ParseError perr;
            if (keychord::ParseSequence(text, seq, perr))
                continue;
            std::cerr << file << ": action '" << b.action << "': key \"" << text << "\": " << perr.ToString() << "\n";
            PrintCaret(text, perr.position);
            ++failures;
        }
    }
    return failures;
}

// "select_tab" -> "SelectTab", "page-down" -> "PageDown", "2nd" -> "A2nd".
static std::string TypeName(std::string_view id)
{
    std::string out;
    bool        upper = true;
    for (char c : id)
    {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum)
        {
            upper = true;
            continue;
        }
        if (upper && c >= 'a' && c <= 'z')
            c = (char)(c - 'a' + 'A');
        out += c;
        upper = false;
    }
    if (out.empty() || (out[0] >= '0' && out[0] <= '9'))
        out = "A" + out;
    return out;
}

// Two ids that spell the same type name would make the header ill-formed.
static size_t CheckTypeNames(const std::string& file, const std::vector<keychord::Binding>& bindings)
{
    size_t                             failures = 0;
    std::map<std::string, std::string> seen; // type name -> id
    for (const auto& b : bindings)
    {
        const std::string name = TypeName(b.action);
        const auto [it, inserted] = seen.emplace(name, b.action);
        // A repeated id is left for the table's duplicate-action check.
        if (inserted || it->second == b.action)
            continue;
        std::cerr << file << ": action '" << b.action << "': type name " << name << " is already taken by '"
                  << it->second << "'\n";
        ++failures;
    }
    return failures;
}

// True when some key of `b` goes through a key group, so the action captures a char.
static bool Captures(const keychord::Binding& b)
{
    for (const std::string& text : b.keys)
    {
        keychord::Sequence   seq;
        keychord::ParseError perr;
        if (!keychord::ParseSequence(text, seq, perr))
            continue;
        for (const keychord::KeySpec& k : seq)
        {
            if (k.atom.kind == keychord::KeyAtom::Kind::Group)
                return true;
        }
    }
    return false;
}

static void RenderTypedActions(std::ostringstream& o, const std::vector<keychord::Binding>& bindings)
{
    std::vector<std::string> names;
    std::vector<bool>        captures;
    for (const auto& b : bindings)
    {
        names.push_back(TypeName(b.action));
        captures.push_back(Captures(b));
    }

    o << "\n"
      << "enum class Action\n"
      << "{\n";
    for (const std::string& n : names)
        o << "    " << n << ",\n";
    o << "};\n"
      << "\n"
      << "namespace action\n"
      << "{\n";
    for (size_t i = 0; i < names.size(); ++i)
    {
        o << "struct " << names[i] << "\n"
          << "{\n";
        if (captures[i])
            o << "    char value = 0;\n";
        o << "};\n";
    }
    o << "} // namespace action\n"
      << "\n"
      << "// Alternatives are in Action order.\n"
      << "using BoundAction = std::variant<";
    for (size_t i = 0; i < names.size(); ++i)
        o << (i ? ", " : "") << "action::" << names[i];
    o << ">;\n"
      << "\n"
      << "inline const char* ActionId(Action a)\n"
      << "{\n"
      << "    switch (a)\n"
      << "    {\n";
    for (size_t i = 0; i < names.size(); ++i)
    {
        o << "    case Action::" << names[i] << ":\n"
          << "        return " << CppString(bindings[i].action) << ";\n";
    }
    o << "    }\n"
      << "    return \"\";\n"
      << "}\n"
      << "\n"
      << "inline std::optional<Action> ActionFromId(std::string_view id)\n"
      << "{\n";
    for (size_t i = 0; i < names.size(); ++i)
    {
        o << "    if (id == " << CppString(bindings[i].action) << ")\n"
          << "        return Action::" << names[i] << ";\n";
    }
    o << "    return std::nullopt;\n"
      << "}\n"
      << "\n"
      << "inline Action ActionOf(const BoundAction& b)\n"
      << "{\n"
      << "    return (Action)b.index();\n"
      << "}\n"
      << "\n"
      << "// Maps a resolved key press to its typed action. Captured actions take\n"
      << "// Resolution::captured, or 0 when a named key matched @any.\n"
      << "inline std::optional<BoundAction> Bind(const keychord::Resolution& r)\n"
      << "{\n"
      << "    const std::optional<Action> a = ActionFromId(r.action);\n"
      << "    if (!a)\n"
      << "        return std::nullopt;\n"
      << "    switch (*a)\n"
      << "    {\n";
    for (size_t i = 0; i < names.size(); ++i)
    {
        o << "    case Action::" << names[i] << ":\n";
        if (captures[i])
            o << "        return BoundAction(action::" << names[i] << "{r.captured.value_or('\\0')});\n";
        else
            o << "        return BoundAction(action::" << names[i] << "{});\n";
    }
    o << "    }\n"
      << "    return std::nullopt;\n"
      << "}\n";
}

static std::string RenderHeader(const std::string& source, const std::string& ns, const std::string& fn,
                                const std::vector<keychord::Binding>& bindings)
{
    std::ostringstream o;
    o << "// Generated by keymap_gen from " << source << ". Do not edit.\n"
      << "#pragma once\n"
      << "\n"
      << "#include \"core/binding_table.h\"\n"
      << "\n"
      << "#include <optional>\n"
      << "#include <string_view>\n"
      << "#include <variant>\n"
      << "#include <vector>\n"
      << "\n"
      << "namespace " << ns << "\n"
      << "{\n"
      << "inline std::vector<keychord::Binding> " << fn << "()\n"
      << "{\n"
      << "    return {\n";
    for (const auto& b : bindings)
    {
        o << "        {" << CppString(b.action) << ", {";
        for (size_t i = 0; i < b.keys.size(); ++i)
        {
            if (i)
                o << ", ";
            o << CppString(b.keys[i]);
        }
        o << "}, " << CppString(b.description) << "},\n";
    }
    o << "    };\n"
      << "}\n";
    // std::variant<> is ill-formed, so an empty declaration file gets no typed actions.
    if (!bindings.empty())
        RenderTypedActions(o, bindings);
    o << "\n"
      << "} // namespace " << ns << "\n";
    return o.str();
}

// Leaves an identical file untouched so dependents are not rebuilt.
static bool WriteIfChanged(const std::string& path, const std::string& text, std::string& err)
{
    {
        std::ifstream in(path, std::ios::binary);
        if (in)
        {
            std::stringstream ss;
            ss << in.rdbuf();
            if (ss.str() == text)
                return true;
        }
    }

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        err = "Failed to open " + path + " for writing";
        return false;
    }
    out << text;
    if (!out)
    {
        err = "Failed to write " + path;
        return false;
    }
    return true;
}
} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> positional;
    std::string ns = "keychord::defaults";
    std::string fn = "DefaultBindings";
    bool        check_only = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--namespace")
            ns = std::string(need("--namespace"));
        else if (a == "--function")
            fn = std::string(need("--function"));
        else if (a == "--check")
            check_only = true;
        else if (!a.empty() && a[0] == '-')
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
        else
            positional.emplace_back(a);
    }

    if (positional.empty() || positional.size() > 2 || (positional.size() == 1 && !check_only))
    {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string& input = positional[0];

    keychord::io::BindingModes modes;
    keychord::io::LoadError    lerr;
    if (!keychord::io::LoadBindingsFile(input, modes, lerr))
    {
        std::cerr << "keymap_gen: FAIL: " << input << ": " << lerr.message << "\n";
        return 3;
    }
    const auto def = modes.find(keychord::io::kDefaultMode);
    if (modes.size() != 1 || def == modes.end())
    {
        std::cerr << "keymap_gen: FAIL: " << input << ": expected a single binding set without 'modes'\n";
        return 3;
    }
    const std::vector<keychord::Binding>& bindings = def->second;

    const size_t failures = CheckKeys(input, bindings) + CheckTypeNames(input, bindings);
    if (failures != 0)
    {
        std::cerr << "keymap_gen: FAIL (" << failures << " error(s))\n";
        return 1;
    }

    // Keys parse; now the table-level rules (duplicates, empty actions).
    keychord::BuildError berr;
    if (!keychord::BindingTable::FromBindings(bindings, berr))
    {
        std::cerr << input << ": " << berr.Message() << "\n";
        std::cerr << "keymap_gen: FAIL\n";
        return 1;
    }

    if (check_only)
    {
        std::cout << "keymap_gen: OK (" << bindings.size() << " actions)\n";
        return 0;
    }

    const std::string header = RenderHeader(input, ns, fn, bindings);
    std::string       err;
    if (!WriteIfChanged(positional[1], header, err))
    {
        std::cerr << "keymap_gen: FAIL: " << err << "\n";
        return 3;
    }
    std::cout << "keymap_gen: wrote " << positional[1] << " (" << bindings.size() << " actions)\n";
    return 0;
}
