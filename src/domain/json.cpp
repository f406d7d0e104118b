#include "hq/json.hpp"

#include <cmath>

namespace hq {

namespace {

// Short escape for c, or '\0' when it has none.
char short_escape(char c)
{
    switch (c)
    {
        case '"': return '"';
        case '\\': return '\\';
        case '\b': return 'b';
        case '\f': return 'f';
        case '\n': return 'n';
        case '\r': return 'r';
        case '\t': return 't';
        default: return '\0';
    }
}

} // namespace

std::string json_quote(std::string_view s)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    size_t plain = 0;
    for (size_t i = 0; i < s.size(); ++i)
    {
        const auto uc = static_cast<unsigned char>(s[i]);
        const char esc = short_escape(s[i]);
        if (esc == '\0' && uc >= 0x20) continue;

        out.append(s.substr(plain, i - plain));
        plain = i + 1;
        out.push_back('\\');
        if (esc != '\0')
        {
            out.push_back(esc);
        }
        else
        {
            out.append("u00");
            out.push_back(kHex[uc >> 4]);
            out.push_back(kHex[uc & 0x0f]);
        }
    }
    out.append(s.substr(plain));
    out.push_back('"');
    return out;
}

void write_json_number(std::ostream& os, double v)
{
    if (std::isfinite(v))
        os << v;
    else
        os << "null";
}

} // namespace hq
