/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: ngfx_renderer_lib.cpp
    МОДУЛЬ: ngfx-renderer-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
            Header-only модулиудыг нэг удаа бүтнээр нь compile хийж шалгана.
*/

#include "ngfx/gfx/device.hpp"
#include "ngfx/rhi/backend/backend_factory.hpp"

namespace ngfx
{
    int ngfx_renderer_compiled_target_anchor()
    {
        return 0;
    }
}
