#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: render_texture.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Offscreen render target handle. Color texture-г өөрөө эзэмшинэ,
            depth texture (байвал) backend талд render target-тай хамт устна.
*/


#include <cstdint>
#include <memory>
#include <utility>

#include "ngfx/gfx/drop_tracker.hpp"
#include "ngfx/gfx/texture.hpp"

namespace ngfx
{
    class RenderTexture
    {
    public:
        RenderTexture() = default;

        RenderTexture(uint64_t id, Texture texture, bool has_depth, std::shared_ptr<DropTracker> tracker)
            : ref_(detail::make_resource_ref(ResourceId::render_texture(id), std::move(tracker)))
            , texture_(std::move(texture))
            , has_depth_(has_depth)
        {}

        bool valid() const { return ref_ != nullptr; }
        uint64_t id() const { return ref_ ? ref_->id().id : 0; }
        const Texture& texture() const { return texture_; }
        bool has_depth() const { return has_depth_; }
        int width() const { return texture_.width(); }
        int height() const { return texture_.height(); }

        bool operator==(const RenderTexture& other) const { return ref_ == other.ref_; }

    private:
        std::shared_ptr<const detail::ResourceRef> ref_{};
        Texture texture_{};
        bool has_depth_ = false;
    };
}
