#pragma once

#include "../session/MemoryView.hpp"
#include "../util/Result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace memlink
{

/**
 * @brief Base for schema values decoded over a memory view
 *
 * A schema type T is usable with RemoteHandle::ReadSchema / ReferenceSchema
 * when it provides
 *
 *   static std::optional<size_t> ValueSize();
 *   static Result<T> FromMemory(const std::shared_ptr<IMemoryView>& memory, uint64_t offset);
 *
 * SchemaClass keeps the view and the value's offset inside it; field accessors
 * in derived classes read through ReadField, so a live-backed value always
 * returns the target's current bytes while a snapshot-backed one never
 * touches the channel.
 *
 * Example:
 *   class PlantedBomb : public SchemaClass
 *   {
 *   public:
 *       using SchemaClass::SchemaClass;
 *       static std::optional<size_t> ValueSize() { return 0x40; }
 *       static Result<PlantedBomb> FromMemory(const std::shared_ptr<IMemoryView>& m, uint64_t o)
 *       {
 *           return PlantedBomb(m, o);
 *       }
 *       Result<float> BlowTime() const { return ReadField<float>(0x10); }
 *   };
 */
class SchemaClass
{
public:
    SchemaClass(std::shared_ptr<IMemoryView> memory, uint64_t offset)
        : memory_(std::move(memory))
        , offset_(offset)
    {
    }

    const std::shared_ptr<IMemoryView>& Memory() const noexcept { return memory_; }
    uint64_t Offset() const noexcept { return offset_; }

protected:
    template <typename F>
    Result<F> ReadField(uint64_t field_offset) const
    {
        static_assert(std::is_trivially_copyable_v<F>, "schema fields must be trivially copyable");
        if (!memory_)
            return Status::Error(ErrorKind::InvalidArgument, "schema value without memory", field_offset);
        return memory_->ReadValue<F>(offset_ + field_offset);
    }

    /// Decode a nested schema value embedded at `field_offset`.
    template <typename S>
    Result<S> ReadNested(uint64_t field_offset) const
    {
        return S::FromMemory(memory_, offset_ + field_offset);
    }

    /**
     * @brief Inline char[capacity] field, cut at the first NUL
     *
     * Malformed UTF-8 is replaced rather than rejected.
     */
    Result<std::string> ReadFixedString(uint64_t field_offset, size_t capacity) const;

private:
    std::shared_ptr<IMemoryView> memory_;
    uint64_t offset_;
};

} // namespace memlink
