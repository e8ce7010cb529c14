#pragma once

#include "Requests.hpp"
#include "../util/Result.hpp"

namespace memlink
{

/**
 * @brief Request/response capability to the privileged intermediary
 *
 * Every request type has exactly one response type. Transport or driver
 * errors are reported as ErrorKind::ChannelFailure carrying the address that
 * was being accessed.
 *
 * Implementations must be safe to call from several threads at once; if the
 * underlying transport is not, the implementation serializes requests itself.
 */
class IChannel
{
public:
    virtual ~IChannel() = default;

    virtual Result<ResponseInitialize> Execute(const RequestInitialize& request) = 0;
    virtual Result<ResponseProtectionToggle> Execute(const RequestProtectionToggle& request) = 0;
    virtual Result<ResponseModuleInfo> Execute(const RequestModuleInfo& request) = 0;
    virtual Result<ResponseReadChain> Execute(const RequestReadChain& request) = 0;
    virtual Result<ResponseReadRange> Execute(const RequestReadRange& request) = 0;
    virtual Result<ResponseReadRangeAlloc> Execute(const RequestReadRangeAlloc& request) = 0;
    virtual Result<ResponseFindPattern> Execute(const RequestFindPattern& request) = 0;
};

} // namespace memlink
