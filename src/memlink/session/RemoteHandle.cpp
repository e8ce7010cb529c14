#include "RemoteHandle.hpp"

#include "../text/Utf8.hpp"
#include "../util/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstring>

namespace memlink
{

namespace
{
void LogModule(const char* name, const ModuleInfo& info)
{
    PLOG_DEBUG << "  " << name << " located at " << std::hex << std::uppercase << info.base_address << " ("
               << info.module_size << " bytes)" << std::dec;
}
} // namespace

RemoteHandle::RemoteHandle(std::unique_ptr<IChannel> channel, ModuleTable module_table, SessionOptions options,
                           uint32_t channel_version)
    : channel_(std::move(channel))
    , module_table_(module_table)
    , options_(options)
    , channel_version_(channel_version)
{
}

Result<std::shared_ptr<RemoteHandle>> RemoteHandle::Create(std::unique_ptr<IChannel> channel,
                                                           const SessionOptions& options)
{
    if (!channel)
        return Status::Error(ErrorKind::InvalidArgument, "no channel supplied");

    auto init = channel->Execute(RequestInitialize{});
    if (!init)
    {
        PLOG_ERROR << "Channel handshake failed: " << init.GetStatus().Describe();
        return init.GetStatus();
    }

    // Keep other processes from inspecting this one for the whole session.
    auto protection = channel->Execute(RequestProtectionToggle{ true });
    if (!protection)
    {
        PLOG_ERROR << "Protection toggle rejected: " << protection.GetStatus().Describe();
        return protection.GetStatus();
    }

    auto modules = channel->Execute(RequestModuleInfo{});
    if (!modules)
    {
        PLOG_ERROR << "Module info request failed: " << modules.GetStatus().Describe();
        return modules.GetStatus();
    }
    if (modules->kind != ResponseModuleInfo::Kind::Success)
    {
        return Status::Error(ErrorKind::ChannelFailure,
                             std::string("failed to load module info: ") + ResponseKindName(modules->kind));
    }

    const ModuleTable& table = modules->table;
    PLOG_DEBUG << "Successfully initialized remote handle. Process id " << table.process_id << ", channel version "
               << init->channel_version;
    LogModule("client", table.client);
    LogModule("engine", table.engine);
    LogModule("schemasystem", table.schema_system);

    // constructor is private, make_shared cannot reach it
    std::shared_ptr<RemoteHandle> handle(
        new RemoteHandle(std::move(channel), table, options, init->channel_version));
    return handle;
}

Status RemoteHandle::ProtectProcess() const
{
    auto result = channel_->Execute(RequestProtectionToggle{ true });
    if (!result)
        return result.GetStatus();
    return Status::Success();
}

std::optional<uint64_t> RemoteHandle::ModuleAddress(Module module, uint64_t address) const
{
    return ModuleLocator::ContainingOffset(module, module_table_, address);
}

Result<uint64_t> RemoteHandle::MemoryAddress(Module module, uint64_t offset) const
{
    auto info = ModuleLocator::Resolve(module, module_table_);
    if (!info)
        return Status::Error(ErrorKind::InvalidModule, "invalid module", offset);
    return info->base_address + offset;
}

Status RemoteHandle::ReadBytes(Module module, const OffsetChain& offsets, void* buffer, size_t size) const
{
    PROFILE_SCOPE_FUNCTION();

    auto info = ModuleLocator::Resolve(module, module_table_);
    if (!info)
    {
        return Status::Error(ErrorKind::InvalidModule, "invalid module " + std::to_string(static_cast<int>(module)),
                             offsets.empty() ? std::nullopt : std::optional<uint64_t>(offsets.front()));
    }
    if (offsets.empty())
        return Status::Error(ErrorKind::InvalidArgument, "empty offset chain");
    if (buffer == nullptr && size != 0)
        return Status::Error(ErrorKind::InvalidArgument, "null read buffer");

    OffsetChain chain = offsets;
    chain[0] += info->base_address;

    if (chain.size() == 1)
    {
        RequestReadRange request;
        request.process_id = module_table_.process_id;
        request.address = chain[0];
        request.buffer = buffer;
        request.size = size;

        auto result = channel_->Execute(request);
        if (!result)
            return result.GetStatus();
        return Status::Success();
    }

    RequestReadChain request;
    request.process_id = module_table_.process_id;
    request.offsets = chain.data();
    request.offset_count = chain.size();
    request.buffer = buffer;
    request.size = size;

    auto result = channel_->Execute(request);
    if (!result)
        return result.GetStatus();
    return Status::Success();
}

Result<std::string> RemoteHandle::ReadString(Module module, const OffsetChain& offsets,
                                             std::optional<size_t> expected_length) const
{
    PROFILE_SCOPE_FUNCTION();

    // 8 bytes when unknown, we can't tell how far the target memory is readable
    size_t length = std::max<size_t>(expected_length.value_or(kStringInitialGuess), 1);
    const size_t limit = options_.max_string_length;
    std::vector<char> buffer;

    // TODO: read c-strings inside the channel instead of growing round trips
    for (;;)
    {
        if (limit != 0 && length > limit)
            length = limit;

        buffer.resize(length);
        auto status = ReadBytes(module, offsets, buffer.data(), buffer.size());
        if (!status)
        {
            status.message = "read_string: " + status.message;
            return status;
        }

        auto terminator = std::find(buffer.begin(), buffer.end(), '\0');
        if (terminator != buffer.end())
        {
            std::string text(buffer.begin(), terminator);
            if (!text::IsValidUtf8(text))
                return Status::Error(ErrorKind::DecodeFailure, "invalid string contents");
            return text;
        }

        if (limit != 0 && length >= limit)
        {
            return Status::Error(ErrorKind::StringTooLong,
                                 "no terminator within " + std::to_string(limit) + " bytes");
        }

        length += kStringGrowth;
    }
}

Result<std::shared_ptr<IMemoryView>> RemoteHandle::ReadMemory(const OffsetChain& offsets, size_t size) const
{
    PROFILE_SCOPE_FUNCTION();

    if (offsets.empty())
        return Status::Error(ErrorKind::InvalidArgument, "empty offset chain");

    std::vector<uint8_t> bytes;
    if (offsets.size() == 1)
    {
        RequestReadRangeAlloc request;
        request.process_id = module_table_.process_id;
        request.address = offsets[0];
        request.size = size;

        auto result = channel_->Execute(request);
        if (!result)
            return result.GetStatus();
        if (result->bytes.size() != size)
        {
            return Status::Error(ErrorKind::ChannelFailure,
                                 "short read: " + std::to_string(result->bytes.size()) + " of " +
                                     std::to_string(size) + " bytes",
                                 offsets[0]);
        }
        bytes = std::move(result->bytes);
    }
    else
    {
        bytes.resize(size);
        auto status = ReadBytes(Module::Absolute, offsets, bytes.data(), bytes.size());
        if (!status)
            return status;
    }

    return std::shared_ptr<IMemoryView>(std::make_shared<SnapshotView>(weak_from_this(), std::move(bytes)));
}

Result<std::shared_ptr<IMemoryView>> RemoteHandle::ReferenceMemory(uint64_t address,
                                                                   std::optional<size_t> size) const
{
    if (size && *size <= options_.snapshot_threshold)
    {
        // small windows are cheaper to keep local
        return ReadMemory({ address }, *size);
    }

    return std::shared_ptr<IMemoryView>(std::make_shared<LiveView>(weak_from_this(), address));
}

Result<uint64_t> RemoteHandle::ResolveAddress(const OffsetChain& offsets) const
{
    if (offsets.empty())
        return Status::Error(ErrorKind::InvalidArgument, "empty offset chain");
    if (offsets.size() == 1)
        return offsets[0];

    OffsetChain base_chain(offsets.begin(), offsets.end() - 1);
    auto base = Read<uint64_t>(Module::Absolute, base_chain);
    if (!base)
        return base.GetStatus();
    return *base + offsets.back();
}

Result<std::optional<uint64_t>> RemoteHandle::FindPattern(Module module, const SearchPattern& pattern) const
{
    PROFILE_SCOPE_FUNCTION();

    auto info = ModuleLocator::Resolve(module, module_table_);
    if (!info)
        return Status::Error(ErrorKind::InvalidModule, "invalid module " + std::to_string(static_cast<int>(module)));
    if (!pattern.IsValid())
        return Status::Error(ErrorKind::InvalidArgument, "invalid search pattern");

    RequestFindPattern request;
    request.process_id = module_table_.process_id;
    request.address = info->base_address;
    request.length = info->module_size;
    request.pattern = &pattern;

    auto result = channel_->Execute(request);
    if (!result)
        return result.GetStatus();
    if (!result->address)
        return std::optional<uint64_t>{};

    auto offset = ModuleLocator::ContainingOffset(module, module_table_, *result->address);
    if (!offset)
    {
        PLOG_WARNING << "Pattern hit 0x" << std::hex << *result->address << std::dec << " outside of module "
                     << ModuleName(module);
        return Status::Error(ErrorKind::ChannelFailure, "pattern hit outside of the search window",
                             *result->address);
    }
    return offset;
}

} // namespace memlink
