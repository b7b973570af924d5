#include "symbol_codec.hpp"

#include <cctype>

// Upper-case, surrounding whitespace removed.
static std::string canonize(const std::string &s)
{
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    std::string out = s.substr(first, last - first + 1);
    for (auto &ch : out) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return out;
}

static std::string lower(std::string s)
{
    for (auto &ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string SymbolCodec::to_venue(const std::string &vendor, const std::string &c)
{
    const std::string vendor_lc = lower(vendor);
    std::string v = canonize(c);

    if (vendor_lc == "etrade")
    {
        // share classes use a dash: BRK-B
        for (auto &ch : v)
            if (ch == '.')
                ch = '-';
    }
    return v;
}

std::string SymbolCodec::to_canonical(const std::string &vendor, const std::string &v)
{
    const std::string vendor_lc = lower(vendor);
    std::string c = canonize(v);

    if (vendor_lc == "etrade")
    {
        for (auto &ch : c)
            if (ch == '-')
                ch = '.';
    }
    return c;
}
