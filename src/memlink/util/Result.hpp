#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace memlink
{

enum class ErrorKind
{
    None,
    InvalidModule,   // module identifier does not resolve
    InvalidArgument, // empty offset chain, null buffer
    OutOfBounds,     // offset exceeds an owned buffer
    HandleDropped,   // owning session is gone
    ChannelFailure,  // request/response mechanism failed
    DecodeFailure,   // bytes are not valid text
    SchemaUnsized,   // schema type has no fixed byte size
    StringTooLong    // no terminator within the configured cap
};

const char* ErrorKindName(ErrorKind kind) noexcept;

/**
 * @brief Outcome of an access-layer operation
 *
 * Carries the error kind, a human readable message and, where one was
 * involved, the remote address or buffer offset that was being accessed.
 */
struct Status
{
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::optional<uint64_t> address;

    bool Ok() const noexcept { return kind == ErrorKind::None; }
    explicit operator bool() const noexcept { return Ok(); }

    std::string Describe() const;

    static Status Success() { return {}; }

    static Status Error(ErrorKind kind, std::string message, std::optional<uint64_t> address = std::nullopt)
    {
        Status status;
        status.kind = kind;
        status.message = std::move(message);
        status.address = address;
        return status;
    }
};

/**
 * @brief Value or error
 *
 * The value is only present when the status is Ok. T does not need to be
 * default constructible.
 */
template <typename T>
class Result
{
public:
    Result(T value)
        : value_(std::move(value))
    {
    }

    Result(Status status)
        : status_(std::move(status))
    {
    }

    bool Ok() const noexcept { return status_.Ok() && value_.has_value(); }
    explicit operator bool() const noexcept { return Ok(); }

    const Status& GetStatus() const noexcept { return status_; }
    ErrorKind Kind() const noexcept { return status_.kind; }

    T& Value() & { return *value_; }
    const T& Value() const& { return *value_; }
    T&& Value() && { return std::move(*value_); }

    T ValueOr(T fallback) const
    {
        return Ok() ? *value_ : std::move(fallback);
    }

    T& operator*() & { return *value_; }
    const T& operator*() const& { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

private:
    std::optional<T> value_;
    Status status_;
};

} // namespace memlink
