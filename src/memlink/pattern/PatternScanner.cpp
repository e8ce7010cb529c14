#include "PatternScanner.hpp"

#include "../util/Profile.hpp"

#include <algorithm>

namespace memlink
{

PatternScanner::PatternScanner(ReadFn reader, size_t chunk_size)
    : m_reader(std::move(reader))
    , m_chunk_size(chunk_size)
{
}

std::vector<size_t> PatternScanner::BuildBadCharTable(const SearchPattern& pattern)
{
    std::vector<size_t> table(256, pattern.Size());

    for (size_t i = 0; i < pattern.Size() - 1; ++i)
    {
        if (pattern.mask[i])
        {
            table[pattern.bytes[i]] = pattern.Size() - 1 - i;
        }
    }

    return table;
}

std::optional<size_t> PatternScanner::FindExact(const uint8_t* buffer, size_t buffer_size,
                                                const SearchPattern& pattern,
                                                const std::vector<size_t>& bad_char_table)
{
    if (buffer_size < pattern.Size())
    {
        return std::nullopt;
    }

    size_t i = 0;
    while (i <= buffer_size - pattern.Size())
    {
        size_t j = pattern.Size();

        while (j > 0)
        {
            --j;
            if (buffer[i + j] != pattern.bytes[j])
            {
                break;
            }
            if (j == 0)
            {
                return i;
            }
        }

        uint8_t bad_char = buffer[i + pattern.Size() - 1];
        i += bad_char_table[bad_char];
    }

    return std::nullopt;
}

std::optional<size_t> PatternScanner::FindMasked(const uint8_t* buffer, size_t buffer_size,
                                                 const SearchPattern& pattern)
{
    if (buffer_size < pattern.Size())
    {
        return std::nullopt;
    }

    for (size_t i = 0; i <= buffer_size - pattern.Size(); ++i)
    {
        bool match = true;
        for (size_t j = 0; j < pattern.Size(); ++j)
        {
            if (pattern.mask[j] && buffer[i + j] != pattern.bytes[j])
            {
                match = false;
                break;
            }
        }
        if (match)
        {
            return i;
        }
    }

    return std::nullopt;
}

std::optional<size_t> PatternScanner::FindInBuffer(const uint8_t* buffer, size_t buffer_size,
                                                   const SearchPattern& pattern)
{
    if (!pattern.IsValid() || buffer == nullptr)
    {
        return std::nullopt;
    }

    if (pattern.HasWildcards())
    {
        return FindMasked(buffer, buffer_size, pattern);
    }

    return FindExact(buffer, buffer_size, pattern, BuildBadCharTable(pattern));
}

std::optional<uint64_t> PatternScanner::ScanWindow(uint64_t base, size_t size, const SearchPattern& pattern) const
{
    PROFILE_SCOPE_FUNCTION();
    if (!pattern.IsValid() || size < pattern.Size() || !m_reader)
    {
        return std::nullopt;
    }

    // consecutive chunks overlap by pattern size - 1 bytes
    const size_t chunk_size = std::max(m_chunk_size, pattern.Size());
    const size_t step = chunk_size - (pattern.Size() - 1);

    const bool exact = !pattern.HasWildcards();
    std::vector<size_t> bad_char_table;
    if (exact)
    {
        bad_char_table = BuildBadCharTable(pattern);
    }

    std::vector<uint8_t> buffer(chunk_size);
    for (size_t consumed = 0; consumed + pattern.Size() <= size; consumed += step)
    {
        const size_t length = std::min(chunk_size, size - consumed);
        const uint64_t address = base + consumed;

        {
            PROFILE_SCOPE_CUSTOM("ScanWindow.ReadChunk");
            if (!m_reader(address, buffer.data(), length))
            {
                if (length == size - consumed)
                    break;
                continue;
            }
        }

        auto hit = exact ? FindExact(buffer.data(), length, pattern, bad_char_table)
                         : FindMasked(buffer.data(), length, pattern);
        if (hit)
        {
            return address + *hit;
        }

        if (length == size - consumed)
        {
            break;
        }
    }

    return std::nullopt;
}

} // namespace memlink
