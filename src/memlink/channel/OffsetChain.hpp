#pragma once

#include "../util/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace memlink
{

using OffsetChain = std::vector<uint64_t>;

/// Reads one pointer-sized value from the target, false if unreadable.
using PointerReadFn = std::function<bool(uint64_t address, uint64_t& value)>;

/**
 * @brief Walk an offset chain down to its final address
 *
 * For offsets [A, B, C] the result is *(*(A) + B) + C: every element except
 * the last is dereferenced, the last one is only added. A chain of length 1
 * resolves to the first element without any read.
 *
 * @return the final address, InvalidArgument for an empty chain,
 *         ChannelFailure carrying the unreadable address otherwise
 */
Result<uint64_t> ResolveOffsetChain(const uint64_t* offsets, size_t count, const PointerReadFn& read_pointer);

} // namespace memlink
