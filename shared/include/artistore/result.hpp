/**
 * artistore - Value-or-error return type used by every upload operation.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "artistore/error_codes.hpp"

namespace artistore
{

    struct Error
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    inline Error make_error(ErrorCode code, std::string message)
    {
        return Error{.code = code, .message = std::move(message)};
    }

    template <typename T>
    class Result
    {
    public:
        Result(T value) : storage_(std::move(value)) {}
        Result(Error error) : storage_(std::move(error)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(storage_); }
        explicit operator bool() const noexcept { return ok(); }

        T &value() &
        {
            throw_if_error();
            return std::get<T>(storage_);
        }

        const T &value() const &
        {
            throw_if_error();
            return std::get<T>(storage_);
        }

        T &&value() &&
        {
            throw_if_error();
            return std::get<T>(std::move(storage_));
        }

        const Error &error() const
        {
            if (ok())
            {
                throw std::logic_error("Result holds a value");
            }
            return std::get<Error>(storage_);
        }

        ErrorCode code() const noexcept { return ok() ? ErrorCode::Ok : std::get<Error>(storage_).code; }

        T *operator->() { return &value(); }
        const T *operator->() const { return &value(); }

    private:
        void throw_if_error() const
        {
            if (!ok())
            {
                throw std::logic_error("Result holds an error: " + std::get<Error>(storage_).message);
            }
        }

        std::variant<T, Error> storage_;
    };

    template <>
    class Result<void>
    {
    public:
        Result() = default;
        Result(Error error) : error_(std::move(error)) {}

        bool ok() const noexcept { return !error_.has_value(); }
        explicit operator bool() const noexcept { return ok(); }

        const Error &error() const
        {
            if (!error_)
            {
                throw std::logic_error("Result holds no error");
            }
            return *error_;
        }

        ErrorCode code() const noexcept { return error_ ? error_->code : ErrorCode::Ok; }

    private:
        std::optional<Error> error_;
    };

    using Status = Result<void>;

} // namespace artistore
