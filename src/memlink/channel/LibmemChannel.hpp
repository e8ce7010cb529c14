#pragma once

#include "IChannel.hpp"
#include "../process/ProcessFinder.hpp"

#include <libmem/libmem.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace memlink
{

struct LibmemChannelConfig
{
    /// Target by pid; takes precedence over the name when non-zero.
    ProcessId pid = 0;
    std::string process_name;

    /// Module file names; an empty name selects the target's main module.
    std::string client_module;
    std::string engine_module;
    std::string schema_system_module;

    /// Apply the protection toggle to the local process (PR_SET_DUMPABLE).
    bool honor_protection = true;
};

/**
 * @brief Channel implementation that reads a local process through libmem
 *
 * Stands in for a privileged driver when the target is reachable with the
 * caller's own credentials. Requests are serialized with a mutex.
 */
class LibmemChannel : public IChannel
{
public:
    static constexpr uint32_t kChannelVersion = 1;

    explicit LibmemChannel(LibmemChannelConfig config);
    ~LibmemChannel() override = default;

    Result<ResponseInitialize> Execute(const RequestInitialize& request) override;
    Result<ResponseProtectionToggle> Execute(const RequestProtectionToggle& request) override;
    Result<ResponseModuleInfo> Execute(const RequestModuleInfo& request) override;
    Result<ResponseReadChain> Execute(const RequestReadChain& request) override;
    Result<ResponseReadRange> Execute(const RequestReadRange& request) override;
    Result<ResponseReadRangeAlloc> Execute(const RequestReadRangeAlloc& request) override;
    Result<ResponseFindPattern> Execute(const RequestFindPattern& request) override;

    bool IsAttached() const;

private:
    Status CheckTarget(ProcessId pid) const;
    bool ReadRaw(uint64_t address, void* buffer, size_t size) const;
    std::optional<ModuleInfo> LocateModule(const std::string& module_name) const;

    LibmemChannelConfig m_config;
    std::optional<libmem::Process> m_process;
    mutable std::mutex m_mutex;
};

} // namespace memlink
