#include "SchemaClass.hpp"

#include "../text/Utf8.hpp"

#include <algorithm>
#include <vector>

namespace memlink
{

Result<std::string> SchemaClass::ReadFixedString(uint64_t field_offset, size_t capacity) const
{
    if (!memory_)
        return Status::Error(ErrorKind::InvalidArgument, "schema value without memory", field_offset);

    std::vector<char> buffer(capacity);
    auto status = memory_->ReadInto(offset_ + field_offset, buffer.data(), buffer.size());
    if (!status)
        return status;

    auto terminator = std::find(buffer.begin(), buffer.end(), '\0');
    return text::ToValidUtf8(std::string_view(buffer.data(), static_cast<size_t>(terminator - buffer.begin())));
}

} // namespace memlink
