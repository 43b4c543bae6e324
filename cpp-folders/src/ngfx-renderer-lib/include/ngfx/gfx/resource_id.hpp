#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: resource_id.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Устгах дараалалд орох resource-ийн төрөл + backend id.
            Backend clean() үүгээр аль хүснэгтээс устгахаа мэднэ.
*/


#include <cstdint>
#include <string>

namespace ngfx
{
    enum class ResourceKind : uint8_t
    {
        Buffer = 0,
        Texture = 1,
        Pipeline = 2,
        RenderTexture = 3
    };

    inline const char* resource_kind_name(ResourceKind kind)
    {
        switch (kind)
        {
            case ResourceKind::Buffer: return "buffer";
            case ResourceKind::Texture: return "texture";
            case ResourceKind::Pipeline: return "pipeline";
            case ResourceKind::RenderTexture: return "render_texture";
        }
        return "unknown";
    }

    struct ResourceId
    {
        ResourceKind kind = ResourceKind::Buffer;
        uint64_t id = 0;

        static constexpr ResourceId buffer(uint64_t id) { return ResourceId{ResourceKind::Buffer, id}; }
        static constexpr ResourceId texture(uint64_t id) { return ResourceId{ResourceKind::Texture, id}; }
        static constexpr ResourceId pipeline(uint64_t id) { return ResourceId{ResourceKind::Pipeline, id}; }
        static constexpr ResourceId render_texture(uint64_t id) { return ResourceId{ResourceKind::RenderTexture, id}; }

        friend constexpr bool operator==(const ResourceId&, const ResourceId&) = default;
    };

    inline std::string to_string(const ResourceId& res)
    {
        return std::string(resource_kind_name(res.kind)) + "#" + std::to_string(res.id);
    }
}
