#include "MemoryView.hpp"
#include "RemoteHandle.hpp"

#include <cstring>

namespace memlink
{

namespace
{
Status HandleDropped(uint64_t address)
{
    return Status::Error(ErrorKind::HandleDropped, "remote handle has been dropped", address);
}
} // namespace

SnapshotView::SnapshotView(std::weak_ptr<const RemoteHandle> handle, std::vector<uint8_t> buffer)
    : handle_(std::move(handle))
    , buffer_(std::move(buffer))
{
}

Status SnapshotView::ReadInto(uint64_t offset, void* buffer, size_t size) const
{
    if (offset > buffer_.size() || size > buffer_.size() - offset)
        return Status::Error(ErrorKind::OutOfBounds, "invalid offset", offset);
    if (size == 0)
        return Status::Success();
    if (buffer == nullptr)
        return Status::Error(ErrorKind::InvalidArgument, "null read buffer", offset);

    std::memcpy(buffer, buffer_.data() + offset, size);
    return Status::Success();
}

Result<std::shared_ptr<IMemoryView>> SnapshotView::GetReference(uint64_t address, std::optional<size_t> length) const
{
    auto handle = handle_.lock();
    if (!handle)
        return HandleDropped(address);
    return handle->ReferenceMemory(address, length);
}

Result<std::shared_ptr<IMemoryView>> SnapshotView::ReadRemote(uint64_t address, size_t length) const
{
    auto handle = handle_.lock();
    if (!handle)
        return HandleDropped(address);
    return handle->ReadMemory({ address }, length);
}

LiveView::LiveView(std::weak_ptr<const RemoteHandle> handle, uint64_t address)
    : handle_(std::move(handle))
    , address_(address)
{
}

Status LiveView::ReadInto(uint64_t offset, void* buffer, size_t size) const
{
    auto handle = handle_.lock();
    if (!handle)
        return HandleDropped(address_ + offset);
    return handle->ReadBytes(Module::Absolute, { address_ + offset }, buffer, size);
}

Result<std::shared_ptr<IMemoryView>> LiveView::GetReference(uint64_t address, std::optional<size_t> length) const
{
    auto handle = handle_.lock();
    if (!handle)
        return HandleDropped(address);
    return handle->ReferenceMemory(address, length);
}

Result<std::shared_ptr<IMemoryView>> LiveView::ReadRemote(uint64_t address, size_t length) const
{
    auto handle = handle_.lock();
    if (!handle)
        return HandleDropped(address);
    return handle->ReadMemory({ address }, length);
}

} // namespace memlink
