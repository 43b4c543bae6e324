#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: backend.hpp
    МОДУЛЬ: rhi/core
    ЗОРИЛГО: Device backend-ийн ерөнхий интерфэйс.
            Одоогоор OpenGL ES болон headless backend хэрэгжүүлнэ. Өөр rasterizer
            нэмэхэд зөвхөн энэ интерфэйсийг хангахад хангалттай.
*/


#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "ngfx/core/result.hpp"
#include "ngfx/gfx/buffer.hpp"
#include "ngfx/gfx/commands.hpp"
#include "ngfx/gfx/limits.hpp"
#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/gfx/resource_id.hpp"
#include "ngfx/gfx/texture.hpp"

namespace ngfx
{
    enum class DeviceBackendType : uint8_t
    {
        Headless = 0,
        OpenGLES = 1
    };

    inline const char* device_backend_type_name(DeviceBackendType type)
    {
        switch (type)
        {
            case DeviceBackendType::Headless: return "headless";
            case DeviceBackendType::OpenGLES: return "gles";
        }
        return "unknown";
    }

    class IDeviceBackend
    {
    public:
        virtual ~IDeviceBackend() = default;

        virtual DeviceBackendType type() const = 0;
        virtual const char* name() const { return device_backend_type_name(type()); }
        virtual Limits limits() const { return Limits{}; }

        virtual Result<uint64_t> create_pipeline(
            std::span<const uint8_t> vertex_source,
            std::span<const uint8_t> fragment_source,
            std::span<const VertexAttr> vertex_attrs,
            const PipelineOptions& options) = 0;

        virtual Result<uint64_t> create_vertex_buffer(std::span<const VertexAttr> attrs, VertexStepMode step_mode) = 0;
        virtual Result<uint64_t> create_index_buffer() = 0;
        virtual Result<uint64_t> create_uniform_buffer(uint32_t slot, const std::string& name) = 0;

        // Unknown id-г чимээгүй алгасна.
        virtual void set_buffer_data(uint64_t buffer, std::span<const uint8_t> data) = 0;

        virtual Result<uint64_t> create_texture(const TextureInfo& info) = 0;
        virtual Result<uint64_t> create_render_texture(uint64_t texture_id, const TextureInfo& info) = 0;
        virtual Status update_texture(uint64_t texture, const TextureUpdate& opts) = 0;
        virtual Status read_pixels(uint64_t texture, std::span<uint8_t> bytes, const TextureRead& opts) = 0;

        // target = render texture id, nullopt = default surface
        virtual void render(std::span<const Command> commands, std::optional<uint64_t> target) = 0;
        virtual void clean(std::span<const ResourceId> to_clean) = 0;

        virtual void set_size(int width, int height) = 0;
        virtual void set_dpi(double scale_factor) = 0;
    };
}
