#include "Requests.hpp"

namespace memlink
{

const char* ResponseKindName(ResponseModuleInfo::Kind kind) noexcept
{
    switch (kind)
    {
    case ResponseModuleInfo::Kind::Success:
        return "success";
    case ResponseModuleInfo::Kind::ProcessUnknown:
        return "process unknown";
    case ResponseModuleInfo::Kind::ProcessUbiquitous:
        return "process ubiquitous";
    case ResponseModuleInfo::Kind::UnknownModule:
        return "unknown module";
    }
    return "invalid";
}

} // namespace memlink
