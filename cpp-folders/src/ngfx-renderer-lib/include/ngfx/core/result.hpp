#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: result.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Resource үүсгэх, pixel унших зэрэг алдаа гарч болох үйлдлүүдийн үр дүн.
            Алдааны ангилал (ErrorCode) болон backend-ийн log текстийг хамт зөөнө.
*/


#include <cstdint>
#include <string>
#include <utility>

namespace ngfx
{
    enum class ErrorCode : uint8_t
    {
        None = 0,
        ResourceCreation = 1,
        FramebufferIncomplete = 2,
        InvalidHandleLookup = 3
    };

    inline const char* error_code_name(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::None: return "none";
            case ErrorCode::ResourceCreation: return "resource_creation";
            case ErrorCode::FramebufferIncomplete: return "framebuffer_incomplete";
            case ErrorCode::InvalidHandleLookup: return "invalid_handle_lookup";
        }
        return "unknown";
    }

    template<typename T>
    struct [[nodiscard]] Result
    {
        bool ok = false;
        T value{};
        std::string error{};
        ErrorCode code = ErrorCode::None;

        static Result<T> success(T v)
        {
            return Result<T>{true, std::move(v), {}, ErrorCode::None};
        }

        static Result<T> failure(std::string e, ErrorCode c = ErrorCode::ResourceCreation)
        {
            return Result<T>{false, T{}, std::move(e), c};
        }

        // Forward the error of another result kind.
        template<typename U>
        static Result<T> failure_from(const Result<U>& other)
        {
            return Result<T>{false, T{}, other.error, other.code};
        }

        explicit operator bool() const { return ok; }
    };

    struct [[nodiscard]] Status
    {
        bool ok = false;
        std::string error{};
        ErrorCode code = ErrorCode::None;

        static Status success()
        {
            return Status{true, {}, ErrorCode::None};
        }

        static Status failure(std::string e, ErrorCode c = ErrorCode::ResourceCreation)
        {
            return Status{false, std::move(e), c};
        }

        explicit operator bool() const { return ok; }
    };
}
