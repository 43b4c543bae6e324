#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: buffer.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Vertex/Index/Uniform buffer handle болон vertex attribute layout.
            Stride = attribute-уудын byte хэмжээний нийлбэр (зарласан дарааллаар).
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "ngfx/gfx/drop_tracker.hpp"

namespace ngfx
{
    enum class VertexFormat : uint8_t
    {
        Float32 = 0,
        Float32x2,
        Float32x3,
        Float32x4,
        UInt8,
        UInt8x2,
        UInt8x3,
        UInt8x4,
        UInt8Norm,
        UInt8Normx2,
        UInt8Normx3,
        UInt8Normx4
    };

    inline constexpr uint32_t vertex_format_components(VertexFormat f)
    {
        switch (f)
        {
            case VertexFormat::Float32:
            case VertexFormat::UInt8:
            case VertexFormat::UInt8Norm:
                return 1;
            case VertexFormat::Float32x2:
            case VertexFormat::UInt8x2:
            case VertexFormat::UInt8Normx2:
                return 2;
            case VertexFormat::Float32x3:
            case VertexFormat::UInt8x3:
            case VertexFormat::UInt8Normx3:
                return 3;
            case VertexFormat::Float32x4:
            case VertexFormat::UInt8x4:
            case VertexFormat::UInt8Normx4:
                return 4;
        }
        return 0;
    }

    inline constexpr bool vertex_format_is_float(VertexFormat f)
    {
        return f == VertexFormat::Float32
            || f == VertexFormat::Float32x2
            || f == VertexFormat::Float32x3
            || f == VertexFormat::Float32x4;
    }

    inline constexpr bool vertex_format_normalized(VertexFormat f)
    {
        return f == VertexFormat::UInt8Norm
            || f == VertexFormat::UInt8Normx2
            || f == VertexFormat::UInt8Normx3
            || f == VertexFormat::UInt8Normx4;
    }

    inline constexpr uint32_t vertex_format_bytes(VertexFormat f)
    {
        return vertex_format_components(f) * (vertex_format_is_float(f) ? 4u : 1u);
    }

    enum class VertexStepMode : uint8_t
    {
        Vertex = 0,
        Instance = 1
    };

    struct VertexAttr
    {
        uint32_t location = 0;
        VertexFormat format = VertexFormat::Float32;

        friend constexpr bool operator==(const VertexAttr&, const VertexAttr&) = default;
    };

    struct VertexInfo
    {
        std::vector<VertexAttr> attrs{};
        VertexStepMode step_mode = VertexStepMode::Vertex;

        VertexInfo& attr(uint32_t location, VertexFormat format)
        {
            attrs.push_back(VertexAttr{location, format});
            return *this;
        }

        VertexInfo& step(VertexStepMode mode)
        {
            step_mode = mode;
            return *this;
        }
    };

    struct VertexAttrLayout
    {
        uint32_t location = 0;
        VertexFormat format = VertexFormat::Float32;
        uint32_t components = 0;
        bool normalized = false;
        uint32_t offset = 0;
    };

    struct VertexLayout
    {
        uint32_t stride = 0;
        std::vector<VertexAttrLayout> attrs{};
        VertexStepMode step_mode = VertexStepMode::Vertex;
    };

    inline uint32_t vertex_stride(std::span<const VertexAttr> attrs)
    {
        uint32_t stride = 0;
        for (const VertexAttr& a : attrs) stride += vertex_format_bytes(a.format);
        return stride;
    }

    // Interleaved layout: attribute бүрийн offset нь өмнөх attribute-уудын byte нийлбэр.
    inline VertexLayout make_vertex_layout(std::span<const VertexAttr> attrs, VertexStepMode step_mode = VertexStepMode::Vertex)
    {
        VertexLayout out{};
        out.step_mode = step_mode;
        out.attrs.reserve(attrs.size());
        for (const VertexAttr& a : attrs)
        {
            VertexAttrLayout l{};
            l.location = a.location;
            l.format = a.format;
            l.components = vertex_format_components(a.format);
            l.normalized = vertex_format_normalized(a.format);
            l.offset = out.stride;
            out.attrs.push_back(l);
            out.stride += vertex_format_bytes(a.format);
        }
        return out;
    }

    enum class BufferUsage : uint8_t
    {
        Vertex = 0,
        Index = 1,
        Uniform = 2
    };

    inline const char* buffer_usage_name(BufferUsage usage)
    {
        switch (usage)
        {
            case BufferUsage::Vertex: return "vertex";
            case BufferUsage::Index: return "index";
            case BufferUsage::Uniform: return "uniform";
        }
        return "unknown";
    }

    class Buffer
    {
    public:
        Buffer() = default;

        Buffer(
            uint64_t id,
            BufferUsage usage,
            std::optional<uint32_t> uniform_slot,
            std::optional<VertexLayout> vertex_layout,
            std::shared_ptr<DropTracker> tracker)
            : ref_(detail::make_resource_ref(ResourceId::buffer(id), std::move(tracker)))
            , usage_(usage)
            , uniform_slot_(uniform_slot)
            , vertex_layout_(std::move(vertex_layout))
        {}

        bool valid() const { return ref_ != nullptr; }
        uint64_t id() const { return ref_ ? ref_->id().id : 0; }
        BufferUsage usage() const { return usage_; }
        // Uniform buffer-ийн binding slot. Бусад төрөлд nullopt.
        std::optional<uint32_t> uniform_slot() const { return uniform_slot_; }
        // Vertex buffer-ийн attribute layout. Бусад төрөлд nullptr.
        const VertexLayout* vertex_layout() const { return vertex_layout_ ? &*vertex_layout_ : nullptr; }

        bool operator==(const Buffer& other) const { return ref_ == other.ref_; }

    private:
        std::shared_ptr<const detail::ResourceRef> ref_{};
        BufferUsage usage_ = BufferUsage::Vertex;
        std::optional<uint32_t> uniform_slot_{};
        std::optional<VertexLayout> vertex_layout_{};
    };
}
