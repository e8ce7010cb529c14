#include "Utf8.hpp"

#include <utf8proc.h>

namespace memlink::text
{

bool IsValidUtf8(std::string_view text)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return false;
        pos += bytes;
    }
    return true;
}

std::string ToValidUtf8(std::string_view text)
{
    std::string result;
    result.reserve(text.size());

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            result += "\xEF\xBF\xBD";
            ++pos;
            continue;
        }
        result.append(text.data() + pos, static_cast<size_t>(bytes));
        pos += bytes;
    }
    return result;
}

} // namespace memlink::text
