#include "LibmemChannel.hpp"
#include "OffsetChain.hpp"
#include "../pattern/PatternScanner.hpp"
#include "../process/ProcessFinder.hpp"
#include "../util/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace memlink
{

namespace
{
bool IsReadable(libmem::Prot prot)
{
    switch (prot)
    {
    case libmem::Prot::R:
    case libmem::Prot::XR:
    case libmem::Prot::RW:
    case libmem::Prot::XRW:
        return true;
    default:
        return false;
    }
}

Status ReadFailure(uint64_t address, size_t size)
{
    return Status::Error(ErrorKind::ChannelFailure, "failed to read " + std::to_string(size) + " bytes", address);
}
} // namespace

LibmemChannel::LibmemChannel(LibmemChannelConfig config)
    : m_config(std::move(config))
    , m_process{}
{
}

bool LibmemChannel::IsAttached() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_process.has_value();
}

Status LibmemChannel::CheckTarget(ProcessId pid) const
{
    if (!m_process)
        return Status::Error(ErrorKind::ChannelFailure, "channel not initialized");
    if (static_cast<libmem::Pid>(pid) != m_process->pid)
        return Status::Error(ErrorKind::ChannelFailure, "unknown process id " + std::to_string(pid));
    return Status::Success();
}

bool LibmemChannel::ReadRaw(uint64_t address, void* buffer, size_t size) const
{
    if (size == 0)
        return true;
    if (!m_process || address == 0 || buffer == nullptr)
        return false;

    size_t bytes_read = libmem::ReadMemory(&m_process.value(), static_cast<libmem::Address>(address),
                                           reinterpret_cast<uint8_t*>(buffer), size);
    return bytes_read == size;
}

std::optional<ModuleInfo> LibmemChannel::LocateModule(const std::string& module_name) const
{
    if (!m_process)
        return std::nullopt;

    std::optional<libmem::Module> module;
    if (module_name.empty())
    {
        auto modules = libmem::EnumModules(&m_process.value());
        if (modules && !modules->empty())
            module = modules->front();
    }
    else
    {
        module = libmem::FindModule(&m_process.value(), module_name.c_str());
    }

    if (!module)
        return std::nullopt;

    ModuleInfo info;
    info.base_address = static_cast<uint64_t>(module->base);
    info.module_size = static_cast<size_t>(module->size);
    return info;
}

Result<ResponseInitialize> LibmemChannel::Execute(const RequestInitialize&)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    ProcessId pid = m_config.pid;
    if (pid == 0 && !m_config.process_name.empty())
    {
        auto pids = ProcessFinder::FindByName(m_config.process_name, false);
        if (pids.empty())
            return Status::Error(ErrorKind::ChannelFailure, m_config.process_name + " not found");
        if (pids.size() > 1)
            PLOG_WARNING << pids.size() << " processes named " << m_config.process_name << ", using pid " << pids[0];
        pid = pids[0];
    }
    if (pid == 0)
        return Status::Error(ErrorKind::ChannelFailure, "no target process configured");

    auto process = libmem::GetProcess(static_cast<libmem::Pid>(pid));
    if (!process)
        return Status::Error(ErrorKind::ChannelFailure, "failed to attach to pid " + std::to_string(pid));

    m_process = *process;
    PLOG_INFO << "Attached to " << m_process->name << " (pid " << m_process->pid << ")";

    ResponseInitialize response;
    response.channel_version = kChannelVersion;
    return response;
}

Result<ResponseProtectionToggle> LibmemChannel::Execute(const RequestProtectionToggle& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_config.honor_protection)
        return ResponseProtectionToggle{};

#ifdef __linux__
    // a non-dumpable process cannot be ptraced or read by unprivileged peers
    if (prctl(PR_SET_DUMPABLE, request.enabled ? 0 : 1, 0, 0, 0) != 0)
    {
        int err = errno;
        PLOG_WARNING << "PR_SET_DUMPABLE failed: " << std::strerror(err);
        return Status::Error(ErrorKind::ChannelFailure, std::string("protection toggle failed: ") + std::strerror(err));
    }
#else
    (void)request;
#endif

    return ResponseProtectionToggle{};
}

Result<ResponseModuleInfo> LibmemChannel::Execute(const RequestModuleInfo&)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    ResponseModuleInfo response;
    if (!m_process)
    {
        response.kind = ResponseModuleInfo::Kind::ProcessUnknown;
        return response;
    }

    auto client = LocateModule(m_config.client_module);
    auto engine = LocateModule(m_config.engine_module);
    auto schema_system = LocateModule(m_config.schema_system_module);
    if (!client || !engine || !schema_system)
    {
        PLOG_WARNING << "Module lookup failed (client: " << (client ? "ok" : m_config.client_module)
                     << ", engine: " << (engine ? "ok" : m_config.engine_module)
                     << ", schemasystem: " << (schema_system ? "ok" : m_config.schema_system_module) << ")";
        response.kind = ResponseModuleInfo::Kind::UnknownModule;
        return response;
    }

    response.kind = ResponseModuleInfo::Kind::Success;
    response.table.process_id = static_cast<ProcessId>(m_process->pid);
    response.table.client = *client;
    response.table.engine = *engine;
    response.table.schema_system = *schema_system;
    return response;
}

Result<ResponseReadChain> LibmemChannel::Execute(const RequestReadChain& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto target = CheckTarget(request.process_id);
    if (!target)
        return target;

    auto address = ResolveOffsetChain(request.offsets, request.offset_count,
                                      [this](uint64_t pointer_address, uint64_t& value)
                                      {
                                          return ReadRaw(pointer_address, &value, sizeof(value));
                                      });
    if (!address)
        return address.GetStatus();

    if (!ReadRaw(*address, request.buffer, request.size))
        return ReadFailure(*address, request.size);

    ResponseReadChain response;
    response.resolved_address = *address;
    return response;
}

Result<ResponseReadRange> LibmemChannel::Execute(const RequestReadRange& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto target = CheckTarget(request.process_id);
    if (!target)
        return target;

    if (!ReadRaw(request.address, request.buffer, request.size))
        return ReadFailure(request.address, request.size);

    return ResponseReadRange{};
}

Result<ResponseReadRangeAlloc> LibmemChannel::Execute(const RequestReadRangeAlloc& request)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto target = CheckTarget(request.process_id);
    if (!target)
        return target;

    ResponseReadRangeAlloc response;
    response.bytes.resize(request.size);
    if (!ReadRaw(request.address, response.bytes.data(), response.bytes.size()))
        return ReadFailure(request.address, request.size);

    return response;
}

Result<ResponseFindPattern> LibmemChannel::Execute(const RequestFindPattern& request)
{
    PROFILE_SCOPE_FUNCTION();
    std::lock_guard<std::mutex> lock(m_mutex);

    auto target = CheckTarget(request.process_id);
    if (!target)
        return target;
    if (request.pattern == nullptr || !request.pattern->IsValid())
        return Status::Error(ErrorKind::ChannelFailure, "invalid search pattern", request.address);

    auto segments = libmem::EnumSegments(&m_process.value());
    if (!segments)
        return Status::Error(ErrorKind::ChannelFailure, "failed to enumerate memory segments", request.address);

    const uint64_t window_begin = request.address;
    const uint64_t window_end = request.length > std::numeric_limits<uint64_t>::max() - request.address
                                    ? std::numeric_limits<uint64_t>::max()
                                    : request.address + request.length;

    PatternScanner scanner(
        [this](uint64_t address, void* buffer, size_t size)
        {
            return ReadRaw(address, buffer, size);
        });

    ResponseFindPattern response;
    for (const auto& segment : *segments)
    {
        if (!IsReadable(segment.prot))
            continue;

        const uint64_t begin = std::max<uint64_t>(segment.base, window_begin);
        const uint64_t end = std::min<uint64_t>(segment.end, window_end);
        if (begin >= end)
            continue;

        auto hit = scanner.ScanWindow(begin, static_cast<size_t>(end - begin), *request.pattern);
        if (hit)
        {
            response.address = hit;
            break;
        }
    }

    return response;
}

} // namespace memlink
