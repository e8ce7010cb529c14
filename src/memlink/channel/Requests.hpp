#pragma once

#include "../pattern/Pattern.hpp"
#include "../process/ProcessFinder.hpp"
#include "../session/Module.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace memlink
{

// Session establishment. The channel reports its protocol version.
struct RequestInitialize
{
};

struct ResponseInitialize
{
    uint32_t channel_version = 0;
};

// Marks the local process as not inspectable by other processes.
struct RequestProtectionToggle
{
    bool enabled = true;
};

struct ResponseProtectionToggle
{
};

struct RequestModuleInfo
{
};

struct ResponseModuleInfo
{
    enum class Kind
    {
        Success,
        ProcessUnknown,
        ProcessUbiquitous,
        UnknownModule
    };

    Kind kind = Kind::ProcessUnknown;
    ModuleTable table;
};

const char* ResponseKindName(ResponseModuleInfo::Kind kind) noexcept;

/**
 * Chained read: all offsets but the last are dereferenced as 8 byte pointers,
 * the last one is added to the final pointer and `size` bytes are read there.
 */
struct RequestReadChain
{
    ProcessId process_id = 0;
    const uint64_t* offsets = nullptr;
    size_t offset_count = 0;

    void* buffer = nullptr;
    size_t size = 0;
};

struct ResponseReadChain
{
    uint64_t resolved_address = 0;
};

struct RequestReadRange
{
    ProcessId process_id = 0;
    uint64_t address = 0;

    void* buffer = nullptr;
    size_t size = 0;
};

struct ResponseReadRange
{
};

struct RequestReadRangeAlloc
{
    ProcessId process_id = 0;
    uint64_t address = 0;
    size_t size = 0;
};

struct ResponseReadRangeAlloc
{
    std::vector<uint8_t> bytes;
};

struct RequestFindPattern
{
    ProcessId process_id = 0;
    uint64_t address = 0;
    size_t length = 0;
    const SearchPattern* pattern = nullptr;
};

struct ResponseFindPattern
{
    std::optional<uint64_t> address;
};

} // namespace memlink
