#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Texture descriptor, sub-rect update/read тохиргоо, texture handle.
*/


#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "ngfx/gfx/drop_tracker.hpp"

namespace ngfx
{
    enum class TextureFormat : uint8_t
    {
        Rgba32 = 0,
        R8 = 1,
        Depth16 = 2
    };

    enum class TextureFilter : uint8_t
    {
        Linear = 0,
        Nearest = 1
    };

    inline constexpr uint32_t texture_format_bytes_per_pixel(TextureFormat f)
    {
        switch (f)
        {
            case TextureFormat::Rgba32: return 4;
            case TextureFormat::R8: return 1;
            case TextureFormat::Depth16: return 2;
        }
        return 4;
    }

    inline constexpr bool texture_format_is_depth(TextureFormat f)
    {
        return f == TextureFormat::Depth16;
    }

    inline constexpr size_t texture_byte_size(int width, int height, TextureFormat f)
    {
        if (width <= 0 || height <= 0) return 0;
        return (size_t)width * (size_t)height * (size_t)texture_format_bytes_per_pixel(f);
    }

    struct TextureInfo
    {
        int width = 1;
        int height = 1;
        TextureFormat format = TextureFormat::Rgba32;
        TextureFilter min_filter = TextureFilter::Linear;
        TextureFilter mag_filter = TextureFilter::Linear;
        // Render texture-д хамтрагч depth texture үүсгэх эсэх
        bool depth = false;
        std::vector<uint8_t> bytes{};

        uint32_t bytes_per_pixel() const { return texture_format_bytes_per_pixel(format); }
    };

    struct TextureUpdate
    {
        int x_offset = 0;
        int y_offset = 0;
        int width = 0;
        int height = 0;
        TextureFormat format = TextureFormat::Rgba32;
        std::vector<uint8_t> bytes{};
    };

    struct TextureRead
    {
        int x_offset = 0;
        int y_offset = 0;
        int width = 0;
        int height = 0;
        TextureFormat format = TextureFormat::Rgba32;
    };

    class Texture
    {
    public:
        Texture() = default;

        Texture(uint64_t id, TextureInfo info, std::shared_ptr<DropTracker> tracker)
            : ref_(detail::make_resource_ref(ResourceId::texture(id), std::move(tracker)))
            , width_(info.width)
            , height_(info.height)
            , format_(info.format)
            , min_filter_(info.min_filter)
            , mag_filter_(info.mag_filter)
        {}

        bool valid() const { return ref_ != nullptr; }
        uint64_t id() const { return ref_ ? ref_->id().id : 0; }
        int width() const { return width_; }
        int height() const { return height_; }
        TextureFormat format() const { return format_; }
        TextureFilter min_filter() const { return min_filter_; }
        TextureFilter mag_filter() const { return mag_filter_; }

        bool operator==(const Texture& other) const { return ref_ == other.ref_; }

    private:
        std::shared_ptr<const detail::ResourceRef> ref_{};
        int width_ = 0;
        int height_ = 0;
        TextureFormat format_ = TextureFormat::Rgba32;
        TextureFilter min_filter_ = TextureFilter::Linear;
        TextureFilter mag_filter_ = TextureFilter::Linear;
    };
}
