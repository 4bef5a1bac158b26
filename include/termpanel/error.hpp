#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace termpanel
{

// Stable failure taxonomy. The string tags returned by error_kind_tag() are part
// of the wire protocol and must not change.
enum class ErrorKind : uint8_t
{
    NotFound            = 1,
    ResourceBusy        = 2,
    DependencyMissing   = 3,
    ProcessStartFailure = 4,
    StreamFault         = 5,
    InvalidArgument     = 6,
    Internal            = 7,
};

std::string_view         error_kind_tag(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_tag(std::string_view tag);

struct Error
{
    ErrorKind   kind = ErrorKind::Internal;
    std::string detail;

    std::string to_string() const;
};

inline Error make_error(ErrorKind kind, std::string detail)
{
    return Error{kind, std::move(detail)};
}

// Value-or-error return used at component boundaries.
template <typename T>
class Result
{
   public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T&       value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    T*       operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T&       operator*() { return value(); }
    const T& operator*() const { return value(); }

    const Error& error() const { return std::get<1>(state_); }

   private:
    std::variant<T, Error> state_;
};

// Success-or-error return for operations without a value.
class Status
{
   public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status success() { return Status(); }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return *error_; }

   private:
    std::optional<Error> error_;
};

}   // namespace termpanel
