#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: platform_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Цонх, GL context, entry point resolver өгөх platform давхаргын интерфэйс.
*/


#include <string>

#include "ngfx/platform/platform_input.hpp"
#include "ngfx/rhi/drivers/gles/gles_api.hpp"

namespace ngfx
{
    struct WindowDesc
    {
        std::string title{};
        int width = 1280;
        int height = 720;
        bool resizable = true;
        bool vsync = true;
    };

    class IPlatformRuntime
    {
    public:
        virtual ~IPlatformRuntime() = default;

        virtual bool valid() const = 0;
        virtual const std::string& error() const = 0;
        virtual bool pump_input(PlatformInputState& out) = 0;
        virtual void set_title(const std::string& title) = 0;
        // Логик (цонхны) хэмжээ.
        virtual void window_size(int& width, int& height) const = 0;
        // Drawable pixel / логик pixel харьцаа.
        virtual double dpi_scale() const = 0;
        virtual GlesLoader gl_loader() const = 0;
        virtual void swap_buffers() = 0;
    };
}
