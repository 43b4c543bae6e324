#pragma once

/*
    NGFX RENDERER SAN

    FILE: rect.hpp
    MODULE: gfx
    PURPOSE: Logical (top-left origin) rectangle used by viewport/scissor commands.
*/


namespace ngfx
{
    struct Rect
    {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;

        friend constexpr bool operator==(const Rect&, const Rect&) = default;
    };
}
