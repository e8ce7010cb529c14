#include "OffsetChain.hpp"

namespace memlink
{

Result<uint64_t> ResolveOffsetChain(const uint64_t* offsets, size_t count, const PointerReadFn& read_pointer)
{
    if (offsets == nullptr || count == 0)
        return Status::Error(ErrorKind::InvalidArgument, "empty offset chain");

    uint64_t address = offsets[0];
    for (size_t i = 1; i < count; ++i)
    {
        uint64_t pointer = 0;
        if (!read_pointer(address, pointer))
            return Status::Error(ErrorKind::ChannelFailure, "failed to dereference offset chain link", address);

        address = pointer + offsets[i];
    }

    return address;
}

} // namespace memlink
