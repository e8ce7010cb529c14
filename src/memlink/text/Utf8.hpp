#pragma once

#include <string>
#include <string_view>

namespace memlink::text
{

/// True if `text` is a well formed UTF-8 sequence.
bool IsValidUtf8(std::string_view text);

/// Replaces every malformed sequence with U+FFFD.
std::string ToValidUtf8(std::string_view text);

} // namespace memlink::text
