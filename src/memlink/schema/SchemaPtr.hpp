#pragma once

#include "SchemaClass.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace memlink
{

/**
 * @brief Pointer field to another schema value
 *
 * The pointer itself is read lazily through the owning view. Following it
 * either copies the target (ReadSchema) or wraps it (ReferenceSchema), the
 * latter going through the session's snapshot/live size policy.
 */
template <typename T>
class SchemaPtr : public SchemaClass
{
public:
    using SchemaClass::SchemaClass;

    static std::optional<size_t> ValueSize() { return sizeof(uint64_t); }

    static Result<SchemaPtr<T>> FromMemory(const std::shared_ptr<IMemoryView>& memory, uint64_t offset)
    {
        return SchemaPtr<T>(memory, offset);
    }

    Result<uint64_t> Address() const { return this->template ReadField<uint64_t>(0); }

    Result<bool> IsNull() const
    {
        auto address = Address();
        if (!address)
            return address.GetStatus();
        return *address == 0;
    }

    Result<T> ReadSchema() const
    {
        std::optional<size_t> size = T::ValueSize();
        if (!size)
            return Status::Error(ErrorKind::SchemaUnsized, "schema must have a size");

        auto address = Address();
        if (!address)
            return address.GetStatus();

        auto memory = Memory()->ReadRemote(*address, *size);
        if (!memory)
            return memory.GetStatus();
        return T::FromMemory(*memory, 0x00);
    }

    Result<T> ReferenceSchema() const
    {
        auto address = Address();
        if (!address)
            return address.GetStatus();

        auto memory = Memory()->GetReference(*address, T::ValueSize());
        if (!memory)
            return memory.GetStatus();
        return T::FromMemory(*memory, 0x00);
    }
};

} // namespace memlink
