#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: limits.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Backend-ээс мэдээлэх хязгаарууд. Зөвхөн уншина.
*/


#include <cstdint>

namespace ngfx
{
    struct Limits
    {
        // 0 = backend мэдээлээгүй
        uint32_t max_texture_size = 0;
        uint32_t max_uniform_block_size = 0;
    };
}
