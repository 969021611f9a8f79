#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace crossfig
{
    enum class ErrorCode : uint32_t
    {
        eOk = 0,
        eIO,
        eInvalidArgument,
        eParseError,
        eResolveError,
        eDefinitionError,
        eDependencyError
    };

    struct Error
    {
        ErrorCode   code = ErrorCode::eOk;
        std::string message;

        // Byte offset into the unit source the error points at. Set for
        // errors raised while evaluating an already parsed expression, whose
        // message is not yet formatted against the source.
        std::optional<size_t> offset;

        static Error ok() { return {ErrorCode::eOk, {}}; }

        static Error at(size_t offset, ErrorCode code, std::string message)
        {
            Error e {code, std::move(message)};
            e.offset = offset;
            return e;
        }
    };

    const char* error_code_name(ErrorCode code);

    template<typename T>
    class Result
    {
    public:
        static Result ok(T value)
        {
            Result r;
            r.m_Ok    = true;
            r.m_Value = std::move(value);
            return r;
        }

        static Result err(Error e)
        {
            Result r;
            r.m_Ok    = false;
            r.m_Error = std::move(e);
            return r;
        }

        static Result err(ErrorCode code, std::string message) { return err(Error {code, std::move(message)}); }

        // Passes the error of another result on unchanged.
        template<typename U>
        static Result forward(const Result<U>& other)
        {
            return err(other.error());
        }

        bool         isOk() const { return m_Ok; }
        const T&     value() const { return m_Value; }
        T&           value() { return m_Value; }
        const Error& error() const { return m_Error; }

    private:
        bool  m_Ok = false;
        T     m_Value {};
        Error m_Error {};
    };

    template<>
    class Result<void>
    {
    public:
        static Result ok()
        {
            Result r;
            r.m_Ok = true;
            return r;
        }

        static Result err(Error e)
        {
            Result r;
            r.m_Ok    = false;
            r.m_Error = std::move(e);
            return r;
        }

        static Result err(ErrorCode code, std::string message) { return err(Error {code, std::move(message)}); }

        // Passes the error of another result on unchanged.
        template<typename U>
        static Result forward(const Result<U>& other)
        {
            return err(other.error());
        }

        bool         isOk() const { return m_Ok; }
        const Error& error() const { return m_Error; }

    private:
        bool  m_Ok = false;
        Error m_Error {};
    };
} // namespace crossfig
