#include "Pattern.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace memlink
{

namespace
{
bool IsWildcardToken(const std::string& token)
{
    return token == "??" || token == "?" || token == "." || token == "..";
}

bool ParseHexByte(const std::string& token, uint8_t& out)
{
    if (token.empty() || token.size() > 2)
        return false;

    unsigned value = 0;
    for (char c : token)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
        value = value * 16 + static_cast<unsigned>(std::isdigit(static_cast<unsigned char>(c))
                                                       ? c - '0'
                                                       : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }
    out = static_cast<uint8_t>(value);
    return true;
}
} // namespace

SearchPattern SearchPattern::FromString(const std::string& pattern_str)
{
    SearchPattern pattern;
    std::istringstream iss(pattern_str);
    std::string token;

    while (iss >> token)
    {
        if (IsWildcardToken(token))
        {
            pattern.bytes.push_back(0x00);
            pattern.mask.push_back(false);
            continue;
        }

        uint8_t byte = 0;
        if (!ParseHexByte(token, byte))
            return SearchPattern();

        pattern.bytes.push_back(byte);
        pattern.mask.push_back(true);
    }

    return pattern;
}

SearchPattern SearchPattern::FromBytes(const uint8_t* data, size_t size)
{
    SearchPattern pattern;
    pattern.bytes.assign(data, data + size);
    pattern.mask.assign(size, true);
    return pattern;
}

bool SearchPattern::HasWildcards() const
{
    return std::find(mask.begin(), mask.end(), false) != mask.end();
}

std::string SearchPattern::ToString() const
{
    std::string out;
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (i != 0)
            out += ' ';

        if (i < mask.size() && !mask[i])
        {
            out += "??";
            continue;
        }

        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02X", bytes[i]);
        out += hex;
    }
    return out;
}

} // namespace memlink
