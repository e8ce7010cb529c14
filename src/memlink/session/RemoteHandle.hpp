#pragma once

#include "MemoryView.hpp"
#include "Module.hpp"
#include "../channel/IChannel.hpp"
#include "../channel/OffsetChain.hpp"
#include "../pattern/Pattern.hpp"
#include "../util/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace memlink
{

struct SessionOptions
{
    /// Requests of at most this many bytes are materialized as snapshots by GetReference.
    static constexpr size_t kDefaultSnapshotThreshold = 0x10000;
    static constexpr size_t kDefaultMaxStringLength = 4096;

    size_t snapshot_threshold = kDefaultSnapshotThreshold;

    /// Upper bound for ReadString's growth loop, 0 disables the bound.
    size_t max_string_length = kDefaultMaxStringLength;
};

/**
 * @brief Session with one target process
 *
 * Owns the channel and the module table. Always held through a shared_ptr;
 * memory views only keep a weak reference, so dropping the last owner ends
 * the session even while decoded values are still around.
 */
class RemoteHandle : public std::enable_shared_from_this<RemoteHandle>
{
public:
    static constexpr size_t kStringInitialGuess = 8;
    static constexpr size_t kStringGrowth = 8;

    /**
     * @brief Establish the session: handshake, protection toggle, module table
     *
     * Any failure is fatal and no handle is returned.
     */
    static Result<std::shared_ptr<RemoteHandle>> Create(std::unique_ptr<IChannel> channel,
                                                        const SessionOptions& options = {});

    RemoteHandle(const RemoteHandle&) = delete;
    RemoteHandle& operator=(const RemoteHandle&) = delete;

    /// Re-issue the protection toggle.
    Status ProtectProcess() const;

    const ModuleTable& Modules() const noexcept { return module_table_; }
    ProcessId Pid() const noexcept { return module_table_.process_id; }
    const SessionOptions& Options() const noexcept { return options_; }
    uint32_t ChannelVersion() const noexcept { return channel_version_; }

    /**
     * @brief Offset of an absolute address relative to a module base
     * @return nullopt if the address is outside the module
     */
    std::optional<uint64_t> ModuleAddress(Module module, uint64_t address) const;

    Result<uint64_t> MemoryAddress(Module module, uint64_t offset) const;

    /**
     * @brief Read raw bytes at the end of an offset chain
     *
     * The module base is added to the first offset before the chain is walked.
     */
    Status ReadBytes(Module module, const OffsetChain& offsets, void* buffer, size_t size) const;

    template <typename T>
    Result<T> Read(Module module, const OffsetChain& offsets) const
    {
        static_assert(std::is_trivially_copyable_v<T>, "Read requires a trivially copyable type");

        T value{};
        auto status = ReadBytes(module, offsets, &value, sizeof(T));
        if (!status)
            return status;
        return value;
    }

    template <typename T>
    Status ReadSlice(Module module, const OffsetChain& offsets, T* buffer, size_t count) const
    {
        static_assert(std::is_trivially_copyable_v<T>, "ReadSlice requires a trivially copyable type");
        return ReadBytes(module, offsets, buffer, count * sizeof(T));
    }

    template <typename T>
    Result<std::vector<T>> ReadVec(Module module, const OffsetChain& offsets, size_t length) const
    {
        std::vector<T> values(length);
        auto status = ReadSlice(module, offsets, values.data(), values.size());
        if (!status)
            return status;
        return values;
    }

    /**
     * @brief Read a null terminated UTF-8 string of unknown length
     *
     * Starts with `expected_length` bytes (8 if unset) and grows the read by 8
     * bytes until a terminator shows up. Fails with StringTooLong once the
     * read reaches SessionOptions::max_string_length without one.
     */
    Result<std::string> ReadString(Module module, const OffsetChain& offsets,
                                   std::optional<size_t> expected_length = std::nullopt) const;

    /**
     * @brief Owned snapshot of `size` bytes at the end of an absolute offset chain
     */
    Result<std::shared_ptr<IMemoryView>> ReadMemory(const OffsetChain& offsets, size_t size) const;

    /**
     * @brief View at an absolute address
     *
     * Known lengths up to the snapshot threshold are copied, everything else
     * becomes a live reference.
     */
    Result<std::shared_ptr<IMemoryView>> ReferenceMemory(uint64_t address, std::optional<size_t> size) const;

    /**
     * @brief Copy the whole schema value and decode it from the local buffer
     */
    template <typename T>
    Result<T> ReadSchema(const OffsetChain& offsets) const
    {
        std::optional<size_t> schema_size = T::ValueSize();
        if (!schema_size)
            return Status::Error(ErrorKind::SchemaUnsized, "schema must have a size");

        auto memory = ReadMemory(offsets, *schema_size);
        if (!memory)
            return memory.GetStatus();
        return T::FromMemory(*memory, 0x00);
    }

    /**
     * @brief Wrap the schema value around the remote address
     *
     * Every field access on a live-backed value reads the current bytes from
     * the process. Cheaper than ReadSchema for values accessed once or twice.
     */
    template <typename T>
    Result<T> ReferenceSchema(const OffsetChain& offsets) const
    {
        auto address = ResolveAddress(offsets);
        if (!address)
            return address.GetStatus();

        auto memory = ReferenceMemory(*address, T::ValueSize());
        if (!memory)
            return memory.GetStatus();
        return T::FromMemory(*memory, 0x00);
    }

    /**
     * @brief Search the module's window for a byte pattern
     * @return module-relative offset of the first hit, nullopt if there is none
     */
    Result<std::optional<uint64_t>> FindPattern(Module module, const SearchPattern& pattern) const;

private:
    RemoteHandle(std::unique_ptr<IChannel> channel, ModuleTable module_table, SessionOptions options,
                 uint32_t channel_version);

    /// Absolute address an offset chain ends at, dereferencing all but the last element.
    Result<uint64_t> ResolveAddress(const OffsetChain& offsets) const;

    std::unique_ptr<IChannel> channel_;
    const ModuleTable module_table_;
    const SessionOptions options_;
    const uint32_t channel_version_;
};

} // namespace memlink
