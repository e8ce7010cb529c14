#pragma once

#include "../util/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace memlink
{

class RemoteHandle;

enum class ViewKind
{
    Snapshot,
    Live
};

/**
 * @brief A readable byte window into the target process
 *
 * Exactly two implementations exist: SnapshotView (owned copy) and LiveView
 * (re-read on every access). Which one a caller gets is decided by the
 * session's size policy when the view is created.
 */
class IMemoryView
{
public:
    virtual ~IMemoryView() = default;

    /**
     * @brief Copy `size` bytes starting at `offset` within this window
     */
    virtual Status ReadInto(uint64_t offset, void* buffer, size_t size) const = 0;

    /**
     * @brief View at an absolute address, snapshot or live depending on length
     */
    virtual Result<std::shared_ptr<IMemoryView>> GetReference(uint64_t address,
                                                              std::optional<size_t> length) const = 0;

    /**
     * @brief Owned snapshot of `length` bytes at an absolute address
     */
    virtual Result<std::shared_ptr<IMemoryView>> ReadRemote(uint64_t address, size_t length) const = 0;

    virtual ViewKind Kind() const noexcept = 0;

    template <typename T>
    Result<T> ReadValue(uint64_t offset) const
    {
        static_assert(std::is_trivially_copyable_v<T>, "ReadValue requires a trivially copyable type");

        T value{};
        auto status = ReadInto(offset, &value, sizeof(T));
        if (!status)
            return status;
        return value;
    }
};

class SnapshotView : public IMemoryView
{
public:
    SnapshotView(std::weak_ptr<const RemoteHandle> handle, std::vector<uint8_t> buffer);

    Status ReadInto(uint64_t offset, void* buffer, size_t size) const override;
    Result<std::shared_ptr<IMemoryView>> GetReference(uint64_t address, std::optional<size_t> length) const override;
    Result<std::shared_ptr<IMemoryView>> ReadRemote(uint64_t address, size_t length) const override;
    ViewKind Kind() const noexcept override { return ViewKind::Snapshot; }

    size_t Size() const noexcept { return buffer_.size(); }

private:
    std::weak_ptr<const RemoteHandle> handle_;
    const std::vector<uint8_t> buffer_;
};

class LiveView : public IMemoryView
{
public:
    LiveView(std::weak_ptr<const RemoteHandle> handle, uint64_t address);

    Status ReadInto(uint64_t offset, void* buffer, size_t size) const override;
    Result<std::shared_ptr<IMemoryView>> GetReference(uint64_t address, std::optional<size_t> length) const override;
    Result<std::shared_ptr<IMemoryView>> ReadRemote(uint64_t address, size_t length) const override;
    ViewKind Kind() const noexcept override { return ViewKind::Live; }

    uint64_t Address() const noexcept { return address_; }

private:
    std::weak_ptr<const RemoteHandle> handle_;
    uint64_t address_;
};

} // namespace memlink
