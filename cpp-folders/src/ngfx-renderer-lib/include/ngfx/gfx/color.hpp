#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: color.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Энэ файл нь ngfx-renderer-lib-ийн gfx модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace ngfx
{
    struct Color
    {
        float r = 0.0f;
        float g = 0.0f;
        float b = 0.0f;
        float a = 1.0f;

        static constexpr Color rgba(float r, float g, float b, float a) { return Color{r, g, b, a}; }
        static constexpr Color rgb(float r, float g, float b) { return Color{r, g, b, 1.0f}; }

        // 0xRRGGBBAA
        static constexpr Color from_hex(uint32_t hex)
        {
            return Color{
                (float)((hex >> 24u) & 0xffu) / 255.0f,
                (float)((hex >> 16u) & 0xffu) / 255.0f,
                (float)((hex >> 8u) & 0xffu) / 255.0f,
                (float)(hex & 0xffu) / 255.0f
            };
        }

        std::array<uint8_t, 4> to_rgba_u8() const
        {
            const auto q = [](float v) {
                return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
            };
            return {q(r), q(g), q(b), q(a)};
        }

        friend constexpr bool operator==(const Color&, const Color&) = default;

        static const Color TRANSPARENT;
        static const Color BLACK;
        static const Color WHITE;
        static const Color RED;
        static const Color GREEN;
        static const Color BLUE;
    };

    inline constexpr Color Color::TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};
    inline constexpr Color Color::BLACK{0.0f, 0.0f, 0.0f, 1.0f};
    inline constexpr Color Color::WHITE{1.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr Color Color::RED{1.0f, 0.0f, 0.0f, 1.0f};
    inline constexpr Color Color::GREEN{0.0f, 1.0f, 0.0f, 1.0f};
    inline constexpr Color Color::BLUE{0.0f, 0.0f, 1.0f, 1.0f};
}
