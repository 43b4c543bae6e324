#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: sdl_gl_runtime.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: SDL2 дээр OpenGL ES 3.0 context-тэй цонх. Resolver нь SDL_GL_GetProcAddress.
            Зураг ачаалахад SDL2_image ашиглана (RGBA32 болгон хөрвүүлнэ).
*/


#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "ngfx/core/result.hpp"
#include "ngfx/platform/platform_runtime.hpp"

namespace ngfx
{
    struct Rgba8Image
    {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> pixels{};
    };

    inline Result<Rgba8Image> load_rgba8_image(const std::string& path)
    {
        SDL_Surface* loaded = IMG_Load(path.c_str());
        if (!loaded) return Result<Rgba8Image>::failure("IMG_Load failed for '" + path + "': " + IMG_GetError());

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba) return Result<Rgba8Image>::failure(std::string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError());

        Rgba8Image out{};
        out.width = rgba->w;
        out.height = rgba->h;
        out.pixels.resize((size_t)out.width * (size_t)out.height * 4u);
        if (SDL_LockSurface(rgba) != 0)
        {
            const std::string err = std::string("SDL_LockSurface failed for '") + path + "': " + SDL_GetError();
            SDL_FreeSurface(rgba);
            return Result<Rgba8Image>::failure(err);
        }
        const auto* src = static_cast<const uint8_t*>(rgba->pixels);
        const size_t row = (size_t)out.width * 4u;
        for (int y = 0; y < out.height; ++y)
        {
            std::memcpy(out.pixels.data() + (size_t)y * row, src + (size_t)y * (size_t)rgba->pitch, row);
        }
        SDL_UnlockSurface(rgba);
        SDL_FreeSurface(rgba);
        return Result<Rgba8Image>::success(std::move(out));
    }

    class SdlGlRuntime final : public IPlatformRuntime
    {
    public:
        explicit SdlGlRuntime(const WindowDesc& win)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                error_ = std::string("SDL_Init failed: ") + SDL_GetError();
                return;
            }
            sdl_ready_ = true;

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                error_ = std::string("IMG_Init failed: ") + IMG_GetError();
                return;
            }
            img_ready_ = true;

            SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
            SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
            SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
            SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
            SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

            Uint32 flags = SDL_WINDOW_OPENGL | SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI;
            if (win.resizable) flags |= SDL_WINDOW_RESIZABLE;
            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                win.width,
                win.height,
                flags
            );
            if (!window_)
            {
                error_ = std::string("SDL_CreateWindow failed: ") + SDL_GetError();
                return;
            }

            context_ = SDL_GL_CreateContext(window_);
            if (!context_)
            {
                error_ = std::string("SDL_GL_CreateContext failed: ") + SDL_GetError();
                return;
            }
            SDL_GL_MakeCurrent(window_, context_);
            SDL_GL_SetSwapInterval(win.vsync ? 1 : 0);

            valid_ = true;
        }

        ~SdlGlRuntime() override
        {
            if (context_) SDL_GL_DeleteContext(context_);
            if (window_) SDL_DestroyWindow(window_);
            if (img_ready_) IMG_Quit();
            if (sdl_ready_) SDL_Quit();
        }

        SdlGlRuntime(const SdlGlRuntime&) = delete;
        SdlGlRuntime& operator=(const SdlGlRuntime&) = delete;

        bool valid() const override { return valid_; }
        const std::string& error() const override { return error_; }

        bool pump_input(PlatformInputState& out) override
        {
            out = PlatformInputState{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_s) out.toggle_scissor = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_b) out.cycle_blend = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_o) out.toggle_offscreen = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_F12) out.capture_frame = true;
                if (e.type == SDL_WINDOWEVENT &&
                    (e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED || e.window.event == SDL_WINDOWEVENT_RESIZED))
                {
                    out.resized = true;
                }
            }
            return !out.quit;
        }

        void set_title(const std::string& title) override
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        void window_size(int& width, int& height) const override
        {
            width = 0;
            height = 0;
            if (window_) SDL_GetWindowSize(window_, &width, &height);
        }

        double dpi_scale() const override
        {
            if (!window_) return 1.0;
            int w = 0;
            int h = 0;
            int dw = 0;
            int dh = 0;
            SDL_GetWindowSize(window_, &w, &h);
            SDL_GL_GetDrawableSize(window_, &dw, &dh);
            if (w <= 0 || dw <= 0) return 1.0;
            return (double)dw / (double)w;
        }

        GlesLoader gl_loader() const override
        {
            return [](const char* name) -> void* {
                return SDL_GL_GetProcAddress(name);
            };
        }

        void swap_buffers() override
        {
            if (window_) SDL_GL_SwapWindow(window_);
        }

        SDL_Window* window() const { return window_; }

    private:
        bool valid_ = false;
        bool sdl_ready_ = false;
        bool img_ready_ = false;
        std::string error_{};
        SDL_Window* window_ = nullptr;
        SDL_GLContext context_ = nullptr;
    };
}
