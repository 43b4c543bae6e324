#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: platform_input.hpp
    МОДУЛЬ: platform
    ЗОРИЛГО: Нэг frame-ийн оролтын snapshot (цонхны үйл явдал, demo-ийн toggle товчнууд).
*/


namespace ngfx
{
    struct PlatformInputState
    {
        bool quit = false;
        bool resized = false;
        bool toggle_scissor = false;
        bool cycle_blend = false;
        bool toggle_offscreen = false;
        bool capture_frame = false;
    };
}
