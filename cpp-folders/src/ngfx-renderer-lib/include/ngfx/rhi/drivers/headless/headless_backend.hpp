#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: headless_backend.hpp
    МОДУЛЬ: rhi/drivers/headless
    ЗОРИЛГО: Native API-гүй device backend. Resource-уудыг CPU санах ойд хадгалж,
            гүйцэтгэсэн command-уудыг log-д бичнэ. Render texture-ийн color clear-ийг
            pixel массив дээр хийнэ. GPU-гүй орчинд Device-ийг шалгахад хэрэглэнэ.
*/


#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ngfx/core/log.hpp"
#include "ngfx/core/result.hpp"
#include "ngfx/gfx/color.hpp"
#include "ngfx/gfx/commands.hpp"
#include "ngfx/rhi/core/backend.hpp"

namespace ngfx
{
    struct HeadlessPipeline
    {
        uint32_t stride = 0;
        PipelineOptions options{};
    };

    struct HeadlessBuffer
    {
        BufferUsage usage = BufferUsage::Vertex;
        std::optional<VertexLayout> layout{};
        uint32_t uniform_slot = 0;
        std::string block_name{};
        std::vector<uint8_t> bytes{};
    };

    struct HeadlessTexture
    {
        TextureInfo info{};
        std::vector<uint8_t> pixels{};
    };

    struct HeadlessRenderTarget
    {
        uint64_t color_texture_id = 0;
        std::optional<std::vector<uint16_t>> depth{};
    };

    class HeadlessDeviceBackend final : public IDeviceBackend
    {
    public:
        explicit HeadlessDeviceBackend(Limits limits = Limits{4096, 16384})
            : limits_(limits)
        {}

        DeviceBackendType type() const override { return DeviceBackendType::Headless; }
        Limits limits() const override { return limits_; }

        Result<uint64_t> create_pipeline(
            std::span<const uint8_t> vertex_source,
            std::span<const uint8_t> fragment_source,
            std::span<const VertexAttr> vertex_attrs,
            const PipelineOptions& options) override
        {
            (void)vertex_source;
            (void)fragment_source;
            const uint64_t id = next_pipeline_id_++;
            pipelines_.emplace(id, HeadlessPipeline{vertex_stride(vertex_attrs), options});
            return Result<uint64_t>::success(id);
        }

        Result<uint64_t> create_vertex_buffer(std::span<const VertexAttr> attrs, VertexStepMode step_mode) override
        {
            HeadlessBuffer buf{};
            buf.usage = BufferUsage::Vertex;
            buf.layout = make_vertex_layout(attrs, step_mode);
            return register_buffer(std::move(buf));
        }

        Result<uint64_t> create_index_buffer() override
        {
            HeadlessBuffer buf{};
            buf.usage = BufferUsage::Index;
            return register_buffer(std::move(buf));
        }

        Result<uint64_t> create_uniform_buffer(uint32_t slot, const std::string& name) override
        {
            HeadlessBuffer buf{};
            buf.usage = BufferUsage::Uniform;
            buf.uniform_slot = slot;
            buf.block_name = name;
            return register_buffer(std::move(buf));
        }

        void set_buffer_data(uint64_t buffer, std::span<const uint8_t> data) override
        {
            auto it = buffers_.find(buffer);
            if (it == buffers_.end()) return;
            it->second.bytes.assign(data.begin(), data.end());
        }

        Result<uint64_t> create_texture(const TextureInfo& info) override
        {
            HeadlessTexture tex{};
            tex.info = info;
            tex.info.bytes.clear();
            tex.pixels.assign(texture_byte_size(info.width, info.height, info.format), 0);
            if (!texture_format_is_depth(info.format) && !info.bytes.empty())
            {
                std::copy_n(info.bytes.begin(), std::min(info.bytes.size(), tex.pixels.size()), tex.pixels.begin());
            }
            const uint64_t id = next_texture_id_++;
            textures_.emplace(id, std::move(tex));
            return Result<uint64_t>::success(id);
        }

        Result<uint64_t> create_render_texture(uint64_t texture_id, const TextureInfo& info) override
        {
            if (textures_.count(texture_id) == 0)
            {
                return Result<uint64_t>::failure("Error creating render texture: texture id " + std::to_string(texture_id) + " not found.");
            }

            HeadlessRenderTarget rt{};
            rt.color_texture_id = texture_id;
            if (info.depth) rt.depth = std::vector<uint16_t>((size_t)info.width * (size_t)info.height, 0);
            const uint64_t id = next_render_target_id_++;
            render_targets_.emplace(id, std::move(rt));
            return Result<uint64_t>::success(id);
        }

        Status update_texture(uint64_t texture, const TextureUpdate& opts) override
        {
            auto it = textures_.find(texture);
            if (it == textures_.end())
            {
                return Status::failure("Error updating texture: texture id " + std::to_string(texture) + " not found.", ErrorCode::InvalidHandleLookup);
            }
            HeadlessTexture& tex = it->second;
            if (!region_inside(tex.info, opts.x_offset, opts.y_offset, opts.width, opts.height, opts.format))
            {
                return Status::failure("Error updating texture: region outside of texture bounds.");
            }

            const size_t row = (size_t)opts.width * texture_format_bytes_per_pixel(opts.format);
            for (int y = 0; y < opts.height; ++y)
            {
                std::memcpy(
                    tex.pixels.data() + pixel_offset(tex.info, opts.x_offset, opts.y_offset + y),
                    opts.bytes.data() + (size_t)y * row,
                    row);
            }
            return Status::success();
        }

        Status read_pixels(uint64_t texture, std::span<uint8_t> bytes, const TextureRead& opts) override
        {
            auto it = textures_.find(texture);
            if (it == textures_.end())
            {
                return Status::failure("Error reading pixels: texture id " + std::to_string(texture) + " not found.", ErrorCode::InvalidHandleLookup);
            }
            const HeadlessTexture& tex = it->second;
            if (!region_inside(tex.info, opts.x_offset, opts.y_offset, opts.width, opts.height, opts.format))
            {
                return Status::failure("Error reading pixels: region outside of texture bounds.");
            }

            const size_t row = (size_t)opts.width * texture_format_bytes_per_pixel(opts.format);
            for (int y = 0; y < opts.height; ++y)
            {
                std::memcpy(
                    bytes.data() + (size_t)y * row,
                    tex.pixels.data() + pixel_offset(tex.info, opts.x_offset, opts.y_offset + y),
                    row);
            }
            return Status::success();
        }

        void render(std::span<const Command> commands, std::optional<uint64_t> target) override
        {
            for (const Command& cmd : commands)
            {
                if (execute(cmd, target)) executed_.push_back(cmd);
            }
        }

        void clean(std::span<const ResourceId> to_clean) override
        {
            clean_batches_.emplace_back(to_clean.begin(), to_clean.end());
            for (const ResourceId& res : to_clean)
            {
                switch (res.kind)
                {
                    case ResourceKind::Buffer: buffers_.erase(res.id); break;
                    case ResourceKind::Texture: textures_.erase(res.id); break;
                    case ResourceKind::Pipeline: pipelines_.erase(res.id); break;
                    case ResourceKind::RenderTexture: render_targets_.erase(res.id); break;
                }
            }
        }

        void set_size(int width, int height) override
        {
            width_ = width;
            height_ = height;
        }

        void set_dpi(double scale_factor) override { dpi_ = scale_factor; }

        int width() const { return width_; }
        int height() const { return height_; }
        double dpi() const { return dpi_; }

        bool contains(const ResourceId& res) const
        {
            switch (res.kind)
            {
                case ResourceKind::Buffer: return buffers_.count(res.id) != 0;
                case ResourceKind::Texture: return textures_.count(res.id) != 0;
                case ResourceKind::Pipeline: return pipelines_.count(res.id) != 0;
                case ResourceKind::RenderTexture: return render_targets_.count(res.id) != 0;
            }
            return false;
        }

        size_t live_count() const
        {
            return pipelines_.size() + buffers_.size() + textures_.size() + render_targets_.size();
        }

        const HeadlessBuffer* buffer(uint64_t id) const
        {
            auto it = buffers_.find(id);
            return it == buffers_.end() ? nullptr : &it->second;
        }

        const HeadlessRenderTarget* render_target(uint64_t id) const
        {
            auto it = render_targets_.find(id);
            return it == render_targets_.end() ? nullptr : &it->second;
        }

        const std::vector<Command>& executed() const { return executed_; }
        const std::vector<std::vector<ResourceId>>& clean_batches() const { return clean_batches_; }
        uint32_t draw_calls() const { return draw_calls_; }
        // Index buffer bind хийгдсэн үеийн draw-ууд. Begin/SetPipeline/End дээр тэглэгдэнэ.
        uint32_t indexed_draw_calls() const { return indexed_draw_calls_; }

        void reset_log()
        {
            executed_.clear();
            clean_batches_.clear();
            draw_calls_ = 0;
            indexed_draw_calls_ = 0;
        }

    private:
        Result<uint64_t> register_buffer(HeadlessBuffer buf)
        {
            const uint64_t id = next_buffer_id_++;
            buffers_.emplace(id, std::move(buf));
            return Result<uint64_t>::success(id);
        }

        static bool region_inside(const TextureInfo& info, int x, int y, int w, int h, TextureFormat format)
        {
            if (format != info.format) return false;
            if (x < 0 || y < 0 || w <= 0 || h <= 0) return false;
            return w <= info.width - x && h <= info.height - y;
        }

        static size_t pixel_offset(const TextureInfo& info, int x, int y)
        {
            return ((size_t)y * (size_t)info.width + (size_t)x) * info.bytes_per_pixel();
        }

        // false = unknown id, command алгасагдсан.
        bool execute(const Command& cmd, std::optional<uint64_t> target)
        {
            if (const auto* c = std::get_if<CmdBegin>(&cmd))
            {
                if (target && render_targets_.count(*target) == 0)
                {
                    log_debug("[ngfx][headless] begin: unknown render target " + std::to_string(*target));
                    return false;
                }
                using_indices_ = false;
                if (target) clear_render_target(render_targets_.at(*target), *c);
                return true;
            }
            if (std::get_if<CmdEnd>(&cmd))
            {
                using_indices_ = false;
                return true;
            }
            if (const auto* c = std::get_if<CmdSetPipeline>(&cmd))
            {
                if (pipelines_.count(c->id) == 0) return skip(cmd, c->id);
                using_indices_ = false;
                return true;
            }
            if (const auto* c = std::get_if<CmdBindBuffer>(&cmd))
            {
                auto it = buffers_.find(c->id);
                if (it == buffers_.end()) return skip(cmd, c->id);
                if (it->second.usage == BufferUsage::Index) using_indices_ = true;
                return true;
            }
            if (std::get_if<CmdDraw>(&cmd) || std::get_if<CmdDrawInstanced>(&cmd))
            {
                ++draw_calls_;
                if (using_indices_) ++indexed_draw_calls_;
                return true;
            }
            if (const auto* c = std::get_if<CmdBindTexture>(&cmd))
            {
                if (textures_.count(c->id) == 0) return skip(cmd, c->id);
                return true;
            }
            if (const auto* c = std::get_if<CmdSetSize>(&cmd))
            {
                set_size(c->width, c->height);
                return true;
            }
            return true;
        }

        bool skip(const Command& cmd, uint64_t id) const
        {
            log_debug(std::string("[ngfx][headless] ") + command_name(cmd) + ": unknown id " + std::to_string(id));
            return false;
        }

        void clear_render_target(HeadlessRenderTarget& rt, const CmdBegin& cmd)
        {
            if (cmd.depth && rt.depth)
            {
                const float d = std::clamp(*cmd.depth, 0.0f, 1.0f);
                std::fill(rt.depth->begin(), rt.depth->end(), (uint16_t)std::lround(d * 65535.0f));
            }
            if (!cmd.color) return;

            auto it = textures_.find(rt.color_texture_id);
            if (it == textures_.end()) return;
            HeadlessTexture& tex = it->second;
            const auto rgba = cmd.color->to_rgba_u8();
            if (tex.info.format == TextureFormat::Rgba32)
            {
                for (size_t i = 0; i + 3 < tex.pixels.size(); i += 4)
                {
                    tex.pixels[i + 0] = rgba[0];
                    tex.pixels[i + 1] = rgba[1];
                    tex.pixels[i + 2] = rgba[2];
                    tex.pixels[i + 3] = rgba[3];
                }
            }
            else if (tex.info.format == TextureFormat::R8)
            {
                std::fill(tex.pixels.begin(), tex.pixels.end(), rgba[0]);
            }
        }

        Limits limits_{};

        std::unordered_map<uint64_t, HeadlessPipeline> pipelines_{};
        std::unordered_map<uint64_t, HeadlessBuffer> buffers_{};
        std::unordered_map<uint64_t, HeadlessTexture> textures_{};
        std::unordered_map<uint64_t, HeadlessRenderTarget> render_targets_{};

        uint64_t next_pipeline_id_ = 1;
        uint64_t next_buffer_id_ = 1;
        uint64_t next_texture_id_ = 1;
        uint64_t next_render_target_id_ = 1;

        bool using_indices_ = false;
        uint32_t draw_calls_ = 0;
        uint32_t indexed_draw_calls_ = 0;

        std::vector<Command> executed_{};
        std::vector<std::vector<ResourceId>> clean_batches_{};

        int width_ = 1;
        int height_ = 1;
        double dpi_ = 1.0;
    };
}
