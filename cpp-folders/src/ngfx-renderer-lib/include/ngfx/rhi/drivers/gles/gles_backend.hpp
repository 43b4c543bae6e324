#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: gles_backend.hpp
    МОДУЛЬ: rhi/drivers/gles
    ЗОРИЛГО: OpenGL ES 3.0 device backend. Resource хүснэгтүүд (kind бүрт 1-ээс эхлэх id),
            command list-ийн dispatch loop, pass бүрийн frame төлөв (target хэмжээ, dpi).

            GL context энэ объектыг үүсгэсэн thread дээр current байх ёстой.
*/


#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "ngfx/core/config.hpp"
#include "ngfx/core/log.hpp"
#include "ngfx/core/result.hpp"
#include "ngfx/gfx/commands.hpp"
#include "ngfx/rhi/core/backend.hpp"
#include "ngfx/rhi/drivers/gles/gles_api.hpp"
#include "ngfx/rhi/drivers/gles/gles_convert.hpp"
#include "ngfx/rhi/drivers/gles/gles_resources.hpp"
#include "ngfx/rhi/drivers/gles/gles_state.hpp"

namespace ngfx
{
    struct GlesBackendDesc
    {
        GlesLoader loader{};
        int width = 1;
        int height = 1;
        double dpi = 1.0;
        // Command бүрийн дараа glGetError шалгаж warn log бичнэ.
        bool check_errors = false;
    };

    inline GlesBackendDesc apply_env_overrides(GlesBackendDesc desc)
    {
        desc.check_errors = parse_env_bool(std::getenv("NGFX_GLES_CHECK_ERRORS"), desc.check_errors);
        return desc;
    }

    class GlesDeviceBackend final : public IDeviceBackend
    {
    public:
        static Result<std::unique_ptr<GlesDeviceBackend>> create(const GlesBackendDesc& desc)
        {
            Result<GlesApi> api = load_gles_api(desc.loader);
            if (!api.ok) return Result<std::unique_ptr<GlesDeviceBackend>>::failure_from(api);

            std::unique_ptr<GlesDeviceBackend> backend(new GlesDeviceBackend(api.value, desc));
            log_info("[ngfx][gles] backend ready, max texture size: "
                + std::to_string(backend->limits_.max_texture_size)
                + ", max uniform block size: " + std::to_string(backend->limits_.max_uniform_block_size));
            return Result<std::unique_ptr<GlesDeviceBackend>>::success(std::move(backend));
        }

        ~GlesDeviceBackend() override
        {
            for (const auto& [id, pip] : pipelines_) gles::destroy_pipeline(gl_, pip);
            for (const auto& [id, buf] : buffers_) gl_.DeleteBuffers(1, &buf.buffer);
            for (const auto& [id, rt] : render_targets_) destroy_render_target(rt);
            for (const auto& [id, tex] : textures_) gl_.DeleteTextures(1, &tex.texture);
        }

        GlesDeviceBackend(const GlesDeviceBackend&) = delete;
        GlesDeviceBackend& operator=(const GlesDeviceBackend&) = delete;

        DeviceBackendType type() const override { return DeviceBackendType::OpenGLES; }
        Limits limits() const override { return limits_; }

        const GlesApi& api() const { return gl_; }

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

        const gles::GlesPipeline* pipeline(uint64_t id) const
        {
            auto it = pipelines_.find(id);
            return it == pipelines_.end() ? nullptr : &it->second;
        }

        Result<uint64_t> create_pipeline(
            std::span<const uint8_t> vertex_source,
            std::span<const uint8_t> fragment_source,
            std::span<const VertexAttr> vertex_attrs,
            const PipelineOptions& options) override
        {
            Result<gles::GlesPipeline> pip = gles::create_pipeline(gl_, vertex_source, fragment_source, vertex_stride(vertex_attrs));
            if (!pip.ok)
            {
                log_error("[ngfx][gles] pipeline creation failed: " + pip.error);
                return Result<uint64_t>::failure_from(pip);
            }

            pip.value.options = options;
            const uint64_t id = next_pipeline_id_++;
            pipelines_.emplace(id, std::move(pip.value));
            return Result<uint64_t>::success(id);
        }

        Result<uint64_t> create_vertex_buffer(std::span<const VertexAttr> attrs, VertexStepMode step_mode) override
        {
            gles::GlesBuffer buf{};
            buf.usage = BufferUsage::Vertex;
            buf.layout = make_vertex_layout(attrs, step_mode);
            return register_buffer(std::move(buf));
        }

        Result<uint64_t> create_index_buffer() override
        {
            gles::GlesBuffer buf{};
            buf.usage = BufferUsage::Index;
            return register_buffer(std::move(buf));
        }

        Result<uint64_t> create_uniform_buffer(uint32_t slot, const std::string& name) override
        {
            gles::GlesBuffer buf{};
            buf.usage = BufferUsage::Uniform;
            buf.uniform_slot = slot;
            buf.block_name = name;
            return register_buffer(std::move(buf));
        }

        void set_buffer_data(uint64_t buffer, std::span<const uint8_t> data) override
        {
            auto it = buffers_.find(buffer);
            if (it == buffers_.end())
            {
                log_debug("[ngfx][gles] set_buffer_data: unknown buffer " + std::to_string(buffer));
                return;
            }
            gles::upload_buffer(gl_, it->second, data);
            gl_.BindBuffer(gles::buffer_target(it->second.usage), 0);
        }

        Result<uint64_t> create_texture(const TextureInfo& info) override
        {
            gles::GlesTexture tex = gles::create_texture(gl_, info);
            const uint64_t id = next_texture_id_++;
            textures_.emplace(id, tex);
            return Result<uint64_t>::success(id);
        }

        Result<uint64_t> create_render_texture(uint64_t texture_id, const TextureInfo& info) override
        {
            auto tex_it = textures_.find(texture_id);
            if (tex_it == textures_.end())
            {
                return Result<uint64_t>::failure("Error creating render texture: texture id " + std::to_string(texture_id) + " not found.");
            }

            gles::GlesRenderTarget rt{};
            rt.color_texture_id = texture_id;
            rt.width = info.width;
            rt.height = info.height;

            gl_.GenFramebuffers(1, &rt.fbo);
            gl_.BindFramebuffer(GL_FRAMEBUFFER, rt.fbo);
            gl_.FramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex_it->second.texture, 0);

            if (info.depth)
            {
                TextureInfo depth_info{};
                depth_info.width = info.width;
                depth_info.height = info.height;
                depth_info.format = TextureFormat::Depth16;
                rt.depth_texture = gles::create_texture(gl_, depth_info).texture;
            }

            const GLenum status = gl_.CheckFramebufferStatus(GL_FRAMEBUFFER);
            if (status != GL_FRAMEBUFFER_COMPLETE)
            {
                gl_.BindFramebuffer(GL_FRAMEBUFFER, 0);
                destroy_render_target(rt);
                return Result<uint64_t>::failure(
                    "Framebuffer incomplete while creating render texture (status " + std::to_string(status) + ").",
                    ErrorCode::FramebufferIncomplete);
            }

            gl_.ClearColor(0.0f, 0.0f, 0.0f, 0.0f);
            gl_.Clear(GL_COLOR_BUFFER_BIT);
            gl_.BindFramebuffer(GL_FRAMEBUFFER, 0);

            const uint64_t id = next_render_target_id_++;
            render_targets_.emplace(id, rt);
            return Result<uint64_t>::success(id);
        }

        Status update_texture(uint64_t texture, const TextureUpdate& opts) override
        {
            auto it = textures_.find(texture);
            if (it == textures_.end())
            {
                return Status::failure("Error updating texture: texture id " + std::to_string(texture) + " not found.", ErrorCode::InvalidHandleLookup);
            }
            gles::update_texture(gl_, it->second, opts);
            return Status::success();
        }

        // Түр framebuffer үүсгэж уншаад, үр дүнгээс үл хамааран устгана.
        Status read_pixels(uint64_t texture, std::span<uint8_t> bytes, const TextureRead& opts) override
        {
            auto it = textures_.find(texture);
            if (it == textures_.end())
            {
                return Status::failure("Error reading pixels: texture id " + std::to_string(texture) + " not found.", ErrorCode::InvalidHandleLookup);
            }

            GLuint fbo = 0;
            gl_.GenFramebuffers(1, &fbo);
            gl_.BindFramebuffer(GL_FRAMEBUFFER, fbo);
            gl_.FramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, it->second.texture, 0);

            Status out = Status::success();
            const GLenum status = gl_.CheckFramebufferStatus(GL_FRAMEBUFFER);
            if (status == GL_FRAMEBUFFER_COMPLETE)
            {
                const uint32_t bpp = texture_format_bytes_per_pixel(opts.format);
                if (bpp != 4) gl_.PixelStorei(GL_PACK_ALIGNMENT, 1);
                gl_.ReadPixels(
                    opts.x_offset,
                    opts.y_offset,
                    opts.width,
                    opts.height,
                    gles::to_gl_format(opts.format),
                    GL_UNSIGNED_BYTE,
                    bytes.data());
                if (bpp != 4) gl_.PixelStorei(GL_PACK_ALIGNMENT, 4);
            }
            else
            {
                out = Status::failure(
                    "Framebuffer incomplete while reading pixels (status " + std::to_string(status) + ").",
                    ErrorCode::FramebufferIncomplete);
            }

            gl_.BindFramebuffer(GL_FRAMEBUFFER, 0);
            gl_.DeleteFramebuffers(1, &fbo);
            return out;
        }

        void render(std::span<const Command> commands, std::optional<uint64_t> target) override
        {
            for (const Command& cmd : commands)
            {
                if (const auto* c = std::get_if<CmdBegin>(&cmd)) begin_pass(*c, target);
                else if (std::get_if<CmdEnd>(&cmd)) end_pass();
                else if (const auto* c = std::get_if<CmdSetPipeline>(&cmd)) set_pipeline(*c);
                else if (const auto* c = std::get_if<CmdBindBuffer>(&cmd)) bind_buffer(*c);
                else if (const auto* c = std::get_if<CmdDraw>(&cmd)) draw(*c);
                else if (const auto* c = std::get_if<CmdDrawInstanced>(&cmd)) draw_instanced(*c);
                else if (const auto* c = std::get_if<CmdBindTexture>(&cmd)) bind_texture(*c);
                else if (const auto* c = std::get_if<CmdSetSize>(&cmd)) set_size(c->width, c->height);
                else if (const auto* c = std::get_if<CmdSetViewport>(&cmd)) set_viewport(*c);
                else if (const auto* c = std::get_if<CmdSetScissor>(&cmd)) set_scissor(*c);

                if (check_errors_) check_errors(cmd);
            }
        }

        void clean(std::span<const ResourceId> to_clean) override
        {
            for (const ResourceId& res : to_clean)
            {
                switch (res.kind)
                {
                    case ResourceKind::Buffer: clean_buffer(res.id); break;
                    case ResourceKind::Texture: clean_texture(res.id); break;
                    case ResourceKind::Pipeline: clean_pipeline(res.id); break;
                    case ResourceKind::RenderTexture: clean_render_target(res.id); break;
                }
            }
        }

        void set_size(int width, int height) override
        {
            width_ = width;
            height_ = height;
            if (frame_.default_surface)
            {
                frame_.width = width;
                frame_.height = height;
            }
        }

        void set_dpi(double scale_factor) override
        {
            dpi_ = scale_factor;
            if (frame_.default_surface) frame_.dpi = scale_factor;
        }

    private:
        // Begin дээр тогтоогдож End хүртэл хүчинтэй.
        struct FrameState
        {
            int width = 1;
            int height = 1;
            double dpi = 1.0;
            bool default_surface = true;
        };

        GlesDeviceBackend(const GlesApi& api, const GlesBackendDesc& desc)
            : gl_(api)
            , width_(desc.width)
            , height_(desc.height)
            , dpi_(desc.dpi)
            , check_errors_(desc.check_errors)
        {
            frame_ = FrameState{width_, height_, dpi_, true};

            GLint max_texture_size = 0;
            gl_.GetIntegerv(GL_MAX_TEXTURE_SIZE, &max_texture_size);
            GLint max_uniform_block_size = 0;
            gl_.GetIntegerv(GL_MAX_UNIFORM_BLOCK_SIZE, &max_uniform_block_size);
            limits_.max_texture_size = (uint32_t)std::max(0, max_texture_size);
            limits_.max_uniform_block_size = (uint32_t)std::max(0, max_uniform_block_size);
        }

        Result<uint64_t> register_buffer(gles::GlesBuffer buf)
        {
            gl_.GenBuffers(1, &buf.buffer);
            const uint64_t id = next_buffer_id_++;
            buffers_.emplace(id, std::move(buf));
            return Result<uint64_t>::success(id);
        }

        void destroy_render_target(const gles::GlesRenderTarget& rt)
        {
            gl_.DeleteFramebuffers(1, &rt.fbo);
            if (rt.depth_texture) gl_.DeleteTextures(1, &*rt.depth_texture);
        }

        GLint scaled(float v) const
        {
            return (GLint)((double)v * frame_.dpi);
        }

        void begin_pass(const CmdBegin& cmd, std::optional<uint64_t> target)
        {
            if (target)
            {
                auto it = render_targets_.find(*target);
                if (it == render_targets_.end())
                {
                    log_debug("[ngfx][gles] begin: unknown render target " + std::to_string(*target));
                    return;
                }
                // Offscreen pixel нь төхөөрөмжийн нягтралтай тэнцүү.
                frame_ = FrameState{it->second.width, it->second.height, 1.0, false};
                gl_.BindFramebuffer(GL_FRAMEBUFFER, it->second.fbo);
            }
            else
            {
                frame_ = FrameState{width_, height_, dpi_, true};
                gl_.BindFramebuffer(GL_FRAMEBUFFER, 0);
            }

            gl_.Viewport(0, 0, scaled((float)frame_.width), scaled((float)frame_.height));
            using_indices_ = false;

            GLbitfield mask = 0;
            if (cmd.color)
            {
                gl_.ClearColor(cmd.color->r, cmd.color->g, cmd.color->b, cmd.color->a);
                mask |= GL_COLOR_BUFFER_BIT;
            }
            if (cmd.depth)
            {
                gl_.Enable(GL_DEPTH_TEST);
                gl_.DepthMask(GL_TRUE);
                gl_.ClearDepthf(*cmd.depth);
                mask |= GL_DEPTH_BUFFER_BIT;
            }
            if (cmd.stencil)
            {
                gl_.Enable(GL_STENCIL_TEST);
                gl_.StencilMask(0xff);
                gl_.ClearStencil(*cmd.stencil);
                mask |= GL_STENCIL_BUFFER_BIT;
            }
            if (mask != 0) gl_.Clear(mask);
        }

        void end_pass()
        {
            gl_.Disable(GL_SCISSOR_TEST);
            gl_.BindBuffer(GL_ARRAY_BUFFER, 0);
            gl_.BindBuffer(GL_ELEMENT_ARRAY_BUFFER, 0);
            gl_.BindBuffer(GL_UNIFORM_BUFFER, 0);
            gl_.BindVertexArray(0);
            gl_.BindFramebuffer(GL_FRAMEBUFFER, 0);
            using_indices_ = false;
            current_pipeline_.reset();
            frame_ = FrameState{width_, height_, dpi_, true};
        }

        void set_pipeline(const CmdSetPipeline& cmd)
        {
            auto it = pipelines_.find(cmd.id);
            if (it == pipelines_.end())
            {
                log_debug("[ngfx][gles] set_pipeline: unknown pipeline " + std::to_string(cmd.id));
                return;
            }
            gl_.BindVertexArray(it->second.vao);
            gl_.UseProgram(it->second.program);
            gles::apply_pipeline_state(gl_, cmd.options);
            current_pipeline_ = cmd.id;
            // Element buffer binding нь VAO-ийн төлөв.
            using_indices_ = false;
        }

        gles::GlesPipeline* current_pipeline()
        {
            if (!current_pipeline_) return nullptr;
            auto it = pipelines_.find(*current_pipeline_);
            return it == pipelines_.end() ? nullptr : &it->second;
        }

        void bind_buffer(const CmdBindBuffer& cmd)
        {
            auto it = buffers_.find(cmd.id);
            if (it == buffers_.end())
            {
                log_debug("[ngfx][gles] bind_buffer: unknown buffer " + std::to_string(cmd.id));
                return;
            }

            gles::GlesBuffer& buf = it->second;
            gles::GlesPipeline* pip = current_pipeline();
            switch (buf.usage)
            {
                case BufferUsage::Vertex:
                {
                    gl_.BindBuffer(GL_ARRAY_BUFFER, buf.buffer);
                    if (pip && !gles::vertex_attributes_current(*pip, buf))
                    {
                        gles::specify_vertex_attributes(gl_, *pip, buf);
                    }
                    break;
                }
                case BufferUsage::Index:
                {
                    gl_.BindBuffer(GL_ELEMENT_ARRAY_BUFFER, buf.buffer);
                    using_indices_ = true;
                    break;
                }
                case BufferUsage::Uniform:
                {
                    if (pip) gles::bind_uniform_block(gl_, buf, pip->program);
                    gl_.BindBufferBase(GL_UNIFORM_BUFFER, buf.uniform_slot, buf.buffer);
                    break;
                }
            }
        }

        // Index offset нь index-ийн тоо, 32 бит index тул byte offset = offset * 4.
        void draw(const CmdDraw& cmd)
        {
            if (using_indices_)
            {
                gl_.DrawElements(
                    gles::to_gl(cmd.primitive),
                    cmd.count,
                    GL_UNSIGNED_INT,
                    reinterpret_cast<const void*>((uintptr_t)cmd.offset * 4u));
            }
            else
            {
                gl_.DrawArrays(gles::to_gl(cmd.primitive), cmd.offset, cmd.count);
            }
        }

        void draw_instanced(const CmdDrawInstanced& cmd)
        {
            if (using_indices_)
            {
                gl_.DrawElementsInstanced(
                    gles::to_gl(cmd.primitive),
                    cmd.count,
                    GL_UNSIGNED_INT,
                    reinterpret_cast<const void*>((uintptr_t)cmd.offset * 4u),
                    cmd.instance_count);
            }
            else
            {
                gl_.DrawArraysInstanced(gles::to_gl(cmd.primitive), cmd.offset, cmd.count, cmd.instance_count);
            }
        }

        void bind_texture(const CmdBindTexture& cmd)
        {
            if (cmd.slot >= gles::k_max_texture_slots)
            {
                log_debug("[ngfx][gles] bind_texture: unsupported texture slot " + std::to_string(cmd.slot));
                return;
            }
            auto it = textures_.find(cmd.id);
            if (it == textures_.end())
            {
                log_debug("[ngfx][gles] bind_texture: unknown texture " + std::to_string(cmd.id));
                return;
            }
            const gles::GlesPipeline* pip = current_pipeline();
            if (!pip || cmd.location >= pip->uniform_locations.size())
            {
                log_debug("[ngfx][gles] bind_texture: uniform location index " + std::to_string(cmd.location) + " out of range");
                return;
            }
            gles::bind_texture(gl_, it->second, cmd.slot, pip->uniform_locations[cmd.location]);
        }

        void set_viewport(const CmdSetViewport& cmd)
        {
            gl_.Viewport(scaled(cmd.x), scaled(cmd.y), scaled(cmd.width), scaled(cmd.height));
        }

        // GL-ийн scissor origin зүүн доод булан.
        void set_scissor(const CmdSetScissor& cmd)
        {
            gl_.Enable(GL_SCISSOR_TEST);
            const float flipped_y = (float)frame_.height - (cmd.height + cmd.y);
            gl_.Scissor(scaled(cmd.x), scaled(flipped_y), scaled(cmd.width), scaled(cmd.height));
        }

        void check_errors(const Command& cmd)
        {
            // Зарим driver алдааг хуримтлуулдаг тул хязгаартай давтана.
            for (int i = 0; i < 8; ++i)
            {
                const GLenum err = gl_.GetError();
                if (err == GL_NO_ERROR) break;
                log_warn(std::string("[ngfx][gles] ") + gles::gl_error_name(err) + " after " + command_name(cmd));
            }
        }

        void clean_buffer(uint64_t id)
        {
            auto it = buffers_.find(id);
            if (it == buffers_.end()) return;
            const GLuint name = it->second.buffer;
            // Устгасан нэрийг GL дахин ашиглаж болох тул VAO cache-ээс арилгана.
            for (auto& [pid, pip] : pipelines_)
            {
                for (auto src = pip.attr_sources.begin(); src != pip.attr_sources.end();)
                {
                    if (src->second == name) src = pip.attr_sources.erase(src);
                    else ++src;
                }
            }
            gl_.DeleteBuffers(1, &name);
            buffers_.erase(it);
        }

        void clean_texture(uint64_t id)
        {
            auto it = textures_.find(id);
            if (it == textures_.end()) return;
            gl_.DeleteTextures(1, &it->second.texture);
            textures_.erase(it);
        }

        void clean_pipeline(uint64_t id)
        {
            auto it = pipelines_.find(id);
            if (it == pipelines_.end()) return;
            const GLuint program = it->second.program;
            for (auto& [bid, buf] : buffers_)
            {
                auto& progs = buf.block_bound_programs;
                progs.erase(std::remove(progs.begin(), progs.end(), program), progs.end());
            }
            gles::destroy_pipeline(gl_, it->second);
            pipelines_.erase(it);
            if (current_pipeline_ && *current_pipeline_ == id) current_pipeline_.reset();
        }

        void clean_render_target(uint64_t id)
        {
            auto it = render_targets_.find(id);
            if (it == render_targets_.end()) return;
            destroy_render_target(it->second);
            render_targets_.erase(it);
        }

        GlesApi gl_{};
        Limits limits_{};

        std::unordered_map<uint64_t, gles::GlesPipeline> pipelines_{};
        std::unordered_map<uint64_t, gles::GlesBuffer> buffers_{};
        std::unordered_map<uint64_t, gles::GlesTexture> textures_{};
        std::unordered_map<uint64_t, gles::GlesRenderTarget> render_targets_{};

        uint64_t next_pipeline_id_ = 1;
        uint64_t next_buffer_id_ = 1;
        uint64_t next_texture_id_ = 1;
        uint64_t next_render_target_id_ = 1;

        std::optional<uint64_t> current_pipeline_{};
        bool using_indices_ = false;

        int width_ = 1;
        int height_ = 1;
        double dpi_ = 1.0;
        FrameState frame_{};
        bool check_errors_ = false;
    };
}
