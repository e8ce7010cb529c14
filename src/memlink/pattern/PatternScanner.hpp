#pragma once

#include "Pattern.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace memlink
{

/**
 * @brief Searches byte windows for a SearchPattern
 *
 * Exact patterns use Boyer-Moore-Horspool, patterns with wildcards fall back
 * to a linear compare. Windows are read in overlapping chunks through the
 * supplied reader so that a match straddling two chunks is still found.
 */
class PatternScanner
{
public:
    using ReadFn = std::function<bool(uint64_t address, void* buffer, size_t size)>;

    static constexpr size_t kDefaultChunkSize = 1024 * 1024;

    explicit PatternScanner(ReadFn reader, size_t chunk_size = kDefaultChunkSize);

    /**
     * @brief Scan [base, base + size) and return the first absolute hit
     *
     * Chunks the reader fails to read are skipped.
     */
    std::optional<uint64_t> ScanWindow(uint64_t base, size_t size, const SearchPattern& pattern) const;

    static std::optional<size_t> FindInBuffer(const uint8_t* buffer, size_t buffer_size,
                                              const SearchPattern& pattern);

private:
    static std::vector<size_t> BuildBadCharTable(const SearchPattern& pattern);

    static std::optional<size_t> FindExact(const uint8_t* buffer, size_t buffer_size, const SearchPattern& pattern,
                                           const std::vector<size_t>& bad_char_table);

    static std::optional<size_t> FindMasked(const uint8_t* buffer, size_t buffer_size,
                                            const SearchPattern& pattern);

    ReadFn m_reader;
    size_t m_chunk_size;
};

} // namespace memlink
