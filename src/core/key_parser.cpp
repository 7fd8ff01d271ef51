#include "core/key_parser.h"

#include <cstdio>
#include <utility>

namespace keychord
{
namespace
{
static bool IsAsciiAlpha(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool IsAsciiDigit(char c)
{
    return c >= '0' && c <= '9';
}

static bool IsSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Printable, non-space ASCII.
static bool IsKeyChar(char c)
{
    return c > 0x20 && c < 0x7f;
}

static std::string ToLower(std::string_view s)
{
    std::string out(s);
    for (char& c : out)
    {
        if (c >= 'A' && c <= 'Z')
            c = (char)(c - 'A' + 'a');
    }
    return out;
}

// Human-readable name of the token at `pos`, for "found: ..." messages.
static std::string Describe(std::string_view text, std::size_t pos)
{
    if (pos >= text.size())
        return "end of input";
    const char c = text[pos];
    if (IsSpace(c))
        return "whitespace";
    if (IsKeyChar(c))
        return std::string(1, c);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "\\x%02X", (unsigned)(unsigned char)c);
    return buf;
}

static bool Fail(ParseError& err, std::size_t pos, std::string message)
{
    err.position = pos;
    err.message = std::move(message);
    return false;
}

static bool ApplyModifier(const std::string& word_lower, Mods& mods)
{
    if (word_lower == "ctrl" || word_lower == "control")
        mods.ctrl = true;
    else if (word_lower == "alt" || word_lower == "option")
        mods.alt = true;
    else if (word_lower == "shift")
        mods.shift = true;
    else if (word_lower == "cmd" || word_lower == "command" || word_lower == "super" || word_lower == "meta")
        mods.cmd = true;
    else
        return false;
    return true;
}

static std::size_t SkipAlpha(std::string_view text, std::size_t pos, std::size_t end)
{
    while (pos < end && IsAsciiAlpha(text[pos]))
        ++pos;
    return pos;
}

// Parses text[begin, end) as exactly one key. Positions in errors are offsets
// into the whole of `text`.
static bool ParseKeyAt(std::string_view text, std::size_t begin, std::size_t end, KeySpec& out, ParseError& err)
{
    if (begin >= end)
        return Fail(err, begin, "expect key, found: " + Describe(text, begin));

    Mods        mods;
    std::size_t p = begin;

    // Modifier prefixes. A word only counts as a modifier when it names one;
    // anything else is left for the atom parser below.
    for (;;)
    {
        const std::size_t q = SkipAlpha(text, p, end);
        if (q - p < 2)
            break;
        Mods next = mods;
        if (!ApplyModifier(ToLower(text.substr(p, q - p)), next))
            break;
        if (q >= end || text[q] != '-')
            return Fail(err, q, "expect '-', found: " + Describe(text, q));
        if (q + 1 >= end)
            return Fail(err, q + 1, "expect key, found: " + Describe(text, q + 1));
        mods = next;
        p = q + 1;
    }

    KeyAtom     atom;
    std::size_t after = p;
    const char  c = text[p];

    if (c == '@' && p + 1 < end && IsAsciiAlpha(text[p + 1]))
    {
        const std::size_t q = SkipAlpha(text, p + 1, end);
        const std::string_view word = text.substr(p + 1, q - p - 1);
        GroupKind g;
        if (!GroupFromName(word, g))
            return Fail(err, p, "unknown key group: @" + std::string(word));
        atom = KeyAtom::Group(g);
        after = q;
    }
    else if (IsAsciiAlpha(c))
    {
        if ((c == 'f' || c == 'F') && p + 1 < end && IsAsciiDigit(text[p + 1]))
        {
            int n = 0;
            std::size_t q = p + 1;
            while (q < end && IsAsciiDigit(text[q]))
            {
                if (n <= kMaxFunctionKey)
                    n = n * 10 + (text[q] - '0');
                ++q;
            }
            // No leading zeros: "f01" is not "f1".
            if (text[p + 1] == '0' || n < 1 || n > kMaxFunctionKey)
                return Fail(err, p, "unknown function key: " + std::string(text.substr(p, q - p)));
            atom = KeyAtom::Function(n);
            after = q;
        }
        else
        {
            const std::size_t q = SkipAlpha(text, p, end);
            if (q - p >= 2)
            {
                const std::string_view word = text.substr(p, q - p);
                NamedKey k;
                if (!NamedKeyFromName(ToLower(word), k))
                    return Fail(err, p, "unknown key name: " + std::string(word));
                atom = KeyAtom::Named(k);
                after = q;
            }
            else
            {
                atom = KeyAtom::Char(c);
                after = p + 1;
            }
        }
    }
    else if (IsKeyChar(c))
    {
        atom = KeyAtom::Char(c);
        after = p + 1;
    }
    else
    {
        return Fail(err, p, "expect key, found: " + Describe(text, p));
    }

    if (after < end)
        return Fail(err, after, "expect end of input, found: " + Describe(text, after));

    out = Normalize(KeySpec{mods, atom});
    return true;
}
} // namespace

std::string ParseError::ToString() const
{
    return message + " (at " + std::to_string(position) + ")";
}

bool ParseKeySpec(std::string_view text, KeySpec& out, ParseError& err)
{
    return ParseKeyAt(text, 0, text.size(), out, err);
}

bool ParseSequence(std::string_view text, Sequence& out, ParseError& err)
{
    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n && IsSpace(text[i]))
        ++i;
    if (i >= n)
        return Fail(err, i, "expect key, found: end of input");

    Sequence seq;
    while (i < n)
    {
        const std::size_t start = i;
        while (i < n && !IsSpace(text[i]))
            ++i;

        KeySpec key;
        if (!ParseKeyAt(text, start, i, key, err))
            return false;
        seq.push_back(key);

        while (i < n && IsSpace(text[i]))
            ++i;
    }

    out = std::move(seq);
    return true;
}

} // namespace keychord
