#include "Result.hpp"

#include <iomanip>
#include <sstream>

namespace memlink
{

const char* ErrorKindName(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::InvalidModule:
        return "invalid module";
    case ErrorKind::InvalidArgument:
        return "invalid argument";
    case ErrorKind::OutOfBounds:
        return "out of bounds";
    case ErrorKind::HandleDropped:
        return "handle dropped";
    case ErrorKind::ChannelFailure:
        return "channel failure";
    case ErrorKind::DecodeFailure:
        return "decode failure";
    case ErrorKind::SchemaUnsized:
        return "schema unsized";
    case ErrorKind::StringTooLong:
        return "string too long";
    }
    return "unknown";
}

std::string Status::Describe() const
{
    if (Ok())
        return "ok";

    std::ostringstream oss;
    oss << ErrorKindName(kind);
    if (!message.empty())
        oss << ": " << message;
    if (address)
        oss << " (at 0x" << std::hex << std::uppercase << *address << ")";
    return oss.str();
}

} // namespace memlink
