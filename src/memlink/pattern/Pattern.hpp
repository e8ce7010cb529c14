#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace memlink
{

/**
 * @brief Byte signature with per-byte wildcard mask
 *
 * Text form is space separated hex bytes, "??", "?" or "." mark a wildcard:
 *   "48 8B 05 ?? ?? ?? ?? 48 85 C0"
 */
struct SearchPattern
{
    std::vector<uint8_t> bytes;
    std::vector<bool> mask;

    static SearchPattern FromString(const std::string& pattern_str);

    static SearchPattern FromBytes(const uint8_t* data, size_t size);

    size_t Size() const { return bytes.size(); }

    bool IsValid() const { return !bytes.empty() && bytes.size() == mask.size(); }

    bool HasWildcards() const;

    std::string ToString() const;
};

} // namespace memlink
