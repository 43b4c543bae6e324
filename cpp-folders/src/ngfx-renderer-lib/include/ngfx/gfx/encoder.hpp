#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: encoder.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Зурах үйлдлүүдийг дарааллаар нь бичиж авна. Semantic шалгалт хийхгүй,
            дарааллыг өөрчлөхгүй. Бичсэн жагсаалтыг Device::render() нэг удаа гүйцэтгэнэ.
*/


#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "ngfx/gfx/buffer.hpp"
#include "ngfx/gfx/commands.hpp"
#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/gfx/rect.hpp"
#include "ngfx/gfx/texture.hpp"

namespace ngfx
{
    class CommandEncoder
    {
    public:
        CommandEncoder() = default;
        CommandEncoder(int width, int height)
            : width_(width), height_(height)
        {}

        int width() const { return width_; }
        int height() const { return height_; }

        void begin(const ClearOptions& clear)
        {
            commands_.push_back(CmdBegin{clear.color, clear.depth, clear.stencil});
        }

        void begin()
        {
            commands_.push_back(CmdBegin{});
        }

        void end()
        {
            commands_.push_back(CmdEnd{});
        }

        void set_pipeline(const Pipeline& pipeline)
        {
            primitive_ = pipeline.options().primitive;
            commands_.push_back(CmdSetPipeline{pipeline.id(), pipeline.options()});
        }

        void bind_buffer(const Buffer& buffer)
        {
            commands_.push_back(CmdBindBuffer{buffer.id()});
        }

        void bind_buffers(std::span<const Buffer* const> buffers)
        {
            for (const Buffer* b : buffers)
            {
                if (b) bind_buffer(*b);
            }
        }

        void bind_texture(const Texture& texture, uint32_t slot, uint32_t location)
        {
            commands_.push_back(CmdBindTexture{texture.id(), slot, location});
        }

        void draw(int32_t offset, int32_t count)
        {
            commands_.push_back(CmdDraw{primitive_, offset, count});
        }

        void draw_instanced(int32_t offset, int32_t count, int32_t instance_count)
        {
            commands_.push_back(CmdDrawInstanced{primitive_, offset, count, instance_count});
        }

        void set_size(int32_t width, int32_t height)
        {
            width_ = width;
            height_ = height;
            commands_.push_back(CmdSetSize{width, height});
        }

        void set_viewport(float x, float y, float width, float height)
        {
            commands_.push_back(CmdSetViewport{x, y, width, height});
        }

        void set_viewport(const Rect& r)
        {
            set_viewport(r.x, r.y, r.width, r.height);
        }

        void set_scissors(float x, float y, float width, float height)
        {
            commands_.push_back(CmdSetScissor{x, y, width, height});
        }

        void set_scissors(const Rect& r)
        {
            set_scissors(r.x, r.y, r.width, r.height);
        }

        const CommandList& commands() const { return commands_; }
        size_t size() const { return commands_.size(); }
        bool empty() const { return commands_.empty(); }

        CommandList take_commands()
        {
            CommandList out{};
            out.swap(commands_);
            return out;
        }

        void clear()
        {
            commands_.clear();
            primitive_ = DrawPrimitive::Triangles;
        }

    private:
        int width_ = 0;
        int height_ = 0;
        DrawPrimitive primitive_ = DrawPrimitive::Triangles;
        CommandList commands_{};
    };
}
