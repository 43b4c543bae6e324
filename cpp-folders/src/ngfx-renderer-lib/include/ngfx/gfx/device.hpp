#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: device.hpp
    МОДУЛЬ: gfx
    ЗОРИЛГО: Device façade. Resource бүрийн builder, frame-ийн size/dpi төлөв,
            command list-ийг backend руу дамжуулах, drop-уудыг цэвэрлэх цэг.

            Builder -> параметр шалгах -> backend id авах -> handle (drop tracker-тэй).
            Handle устахад зөвхөн дараалалд орно; backend дээрх устгал clean()-д л болно.
*/


#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ngfx/core/config.hpp"
#include "ngfx/core/log.hpp"
#include "ngfx/core/result.hpp"
#include "ngfx/gfx/buffer.hpp"
#include "ngfx/gfx/commands.hpp"
#include "ngfx/gfx/drop_tracker.hpp"
#include "ngfx/gfx/encoder.hpp"
#include "ngfx/gfx/limits.hpp"
#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/gfx/render_texture.hpp"
#include "ngfx/gfx/texture.hpp"
#include "ngfx/rhi/core/backend.hpp"

namespace ngfx
{
    class Device;

    class PipelineBuilder
    {
    public:
        explicit PipelineBuilder(Device& device) : device_(&device) {}

        PipelineBuilder& from(std::string_view vertex_source, std::string_view fragment_source)
        {
            vertex_.assign(vertex_source.begin(), vertex_source.end());
            fragment_.assign(fragment_source.begin(), fragment_source.end());
            return *this;
        }

        PipelineBuilder& from_raw(std::span<const uint8_t> vertex_source, std::span<const uint8_t> fragment_source)
        {
            vertex_.assign(vertex_source.begin(), vertex_source.end());
            fragment_.assign(fragment_source.begin(), fragment_source.end());
            return *this;
        }

        PipelineBuilder& with_vertex_info(const VertexInfo& info)
        {
            attrs_ = info.attrs;
            return *this;
        }

        PipelineBuilder& with_color_blend(BlendMode mode) { options_.color_blend = mode; return *this; }
        PipelineBuilder& with_alpha_blend(BlendMode mode) { options_.alpha_blend = mode; return *this; }
        PipelineBuilder& with_cull_mode(CullMode mode) { options_.cull_mode = mode; return *this; }
        PipelineBuilder& with_depth_stencil(DepthStencil ds) { options_.depth_stencil = ds; return *this; }
        PipelineBuilder& with_color_mask(ColorMask mask) { options_.color_mask = mask; return *this; }
        PipelineBuilder& with_stencil(StencilOptions stencil) { options_.stencil = stencil; return *this; }
        PipelineBuilder& with_primitive(DrawPrimitive primitive) { options_.primitive = primitive; return *this; }
        PipelineBuilder& with_options(PipelineOptions options) { options_ = std::move(options); return *this; }

        Result<Pipeline> build();

    private:
        Device* device_ = nullptr;
        std::vector<uint8_t> vertex_{};
        std::vector<uint8_t> fragment_{};
        std::vector<VertexAttr> attrs_{};
        PipelineOptions options_{};
    };

    class VertexBufferBuilder
    {
    public:
        explicit VertexBufferBuilder(Device& device) : device_(&device) {}

        VertexBufferBuilder& with_info(const VertexInfo& info)
        {
            info_ = info;
            return *this;
        }

        VertexBufferBuilder& with_data(std::span<const float> data)
        {
            data_.assign(data.begin(), data.end());
            has_data_ = true;
            return *this;
        }

        Result<Buffer> build();

    private:
        Device* device_ = nullptr;
        VertexInfo info_{};
        std::vector<float> data_{};
        bool has_data_ = false;
    };

    class IndexBufferBuilder
    {
    public:
        explicit IndexBufferBuilder(Device& device) : device_(&device) {}

        IndexBufferBuilder& with_data(std::span<const uint32_t> data)
        {
            data_.assign(data.begin(), data.end());
            has_data_ = true;
            return *this;
        }

        Result<Buffer> build();

    private:
        Device* device_ = nullptr;
        std::vector<uint32_t> data_{};
        bool has_data_ = false;
    };

    class UniformBufferBuilder
    {
    public:
        UniformBufferBuilder(Device& device, uint32_t slot, std::string name)
            : device_(&device), slot_(slot), name_(std::move(name))
        {}

        UniformBufferBuilder& with_data(std::span<const float> data)
        {
            data_.assign(data.begin(), data.end());
            has_data_ = true;
            return *this;
        }

        Result<Buffer> build();

    private:
        Device* device_ = nullptr;
        uint32_t slot_ = 0;
        std::string name_{};
        std::vector<float> data_{};
        bool has_data_ = false;
    };

    class TextureBuilder
    {
    public:
        explicit TextureBuilder(Device& device) : device_(&device) {}

        TextureBuilder& from_bytes(std::span<const uint8_t> bytes, int width, int height)
        {
            info_.bytes.assign(bytes.begin(), bytes.end());
            info_.width = width;
            info_.height = height;
            return *this;
        }

        TextureBuilder& from_empty_buffer(int width, int height)
        {
            info_.bytes.clear();
            info_.width = width;
            info_.height = height;
            return *this;
        }

        TextureBuilder& with_format(TextureFormat format) { info_.format = format; return *this; }

        TextureBuilder& with_filter(TextureFilter min, TextureFilter mag)
        {
            info_.min_filter = min;
            info_.mag_filter = mag;
            return *this;
        }

        Result<Texture> build();

    private:
        Device* device_ = nullptr;
        TextureInfo info_{};
    };

    class RenderTextureBuilder
    {
    public:
        RenderTextureBuilder(Device& device, int width, int height)
            : device_(&device)
        {
            info_.width = width;
            info_.height = height;
        }

        RenderTextureBuilder& with_depth() { info_.depth = true; return *this; }
        RenderTextureBuilder& with_format(TextureFormat format) { info_.format = format; return *this; }

        RenderTextureBuilder& with_filter(TextureFilter min, TextureFilter mag)
        {
            info_.min_filter = min;
            info_.mag_filter = mag;
            return *this;
        }

        Result<RenderTexture> build();

    private:
        Device* device_ = nullptr;
        TextureInfo info_{};
    };

    class TextureUpdater
    {
    public:
        TextureUpdater(Device& device, const Texture& texture)
            : device_(&device), texture_(&texture)
        {
            opts_.width = texture.width();
            opts_.height = texture.height();
            opts_.format = texture.format();
        }

        TextureUpdater& x_offset(int x) { opts_.x_offset = x; return *this; }
        TextureUpdater& y_offset(int y) { opts_.y_offset = y; return *this; }

        TextureUpdater& with_size(int width, int height)
        {
            opts_.width = width;
            opts_.height = height;
            return *this;
        }

        TextureUpdater& with_format(TextureFormat format) { opts_.format = format; return *this; }

        TextureUpdater& with_data(std::span<const uint8_t> bytes)
        {
            opts_.bytes.assign(bytes.begin(), bytes.end());
            return *this;
        }

        Status update();

    private:
        Device* device_ = nullptr;
        const Texture* texture_ = nullptr;
        TextureUpdate opts_{};
    };

    class TextureReader
    {
    public:
        TextureReader(Device& device, const Texture& texture)
            : device_(&device), texture_(&texture)
        {
            opts_.width = texture.width();
            opts_.height = texture.height();
            opts_.format = texture.format();
        }

        TextureReader& x_offset(int x) { opts_.x_offset = x; return *this; }
        TextureReader& y_offset(int y) { opts_.y_offset = y; return *this; }

        TextureReader& with_size(int width, int height)
        {
            opts_.width = width;
            opts_.height = height;
            return *this;
        }

        TextureReader& with_format(TextureFormat format) { opts_.format = format; return *this; }

        Status read_to(std::span<uint8_t> bytes);

    private:
        Device* device_ = nullptr;
        const Texture* texture_ = nullptr;
        TextureRead opts_{};
    };

    class Device
    {
    public:
        // backend нь null байж болохгүй.
        explicit Device(std::unique_ptr<IDeviceBackend> backend, const DeviceConfig& cfg = DeviceConfig{})
            : backend_(std::move(backend))
            , drop_tracker_(std::make_shared<DropTracker>())
        {
            set_size(cfg.width, cfg.height);
            set_dpi(cfg.dpi);
            log_info(std::string("[ngfx] device created on backend: ") + backend_->name());
        }

        ~Device()
        {
            if (backend_) clean();
        }

        // Builder, updater-ууд Device*-г барьдаг тул хуулах, зөөх боломжгүй.
        Device(const Device&) = delete;
        Device& operator=(const Device&) = delete;
        Device(Device&&) = delete;
        Device& operator=(Device&&) = delete;

        Limits limits() const { return backend_->limits(); }
        DeviceBackendType backend_type() const { return backend_->type(); }
        const char* backend_name() const { return backend_->name(); }

        int width() const { return width_; }
        int height() const { return height_; }
        std::pair<int, int> size() const { return {width_, height_}; }

        void set_size(int width, int height)
        {
            width_ = width;
            height_ = height;
            backend_->set_size(width, height);
        }

        double dpi() const { return dpi_; }

        void set_dpi(double scale_factor)
        {
            dpi_ = scale_factor;
            backend_->set_dpi(scale_factor);
        }

        CommandEncoder create_command_encoder() const
        {
            return CommandEncoder(width_, height_);
        }

        PipelineBuilder create_pipeline() { return PipelineBuilder(*this); }
        VertexBufferBuilder create_vertex_buffer() { return VertexBufferBuilder(*this); }
        IndexBufferBuilder create_index_buffer() { return IndexBufferBuilder(*this); }
        UniformBufferBuilder create_uniform_buffer(uint32_t slot, std::string name) { return UniformBufferBuilder(*this, slot, std::move(name)); }
        TextureBuilder create_texture() { return TextureBuilder(*this); }
        RenderTextureBuilder create_render_texture(int width, int height) { return RenderTextureBuilder(*this, width, height); }
        TextureUpdater update_texture(const Texture& texture) { return TextureUpdater(*this, texture); }
        TextureReader read_pixels(const Texture& texture) { return TextureReader(*this, texture); }

        void render(std::span<const Command> commands)
        {
            backend_->render(commands, std::nullopt);
        }

        void render(const CommandEncoder& encoder)
        {
            render(std::span<const Command>(encoder.commands()));
        }

        void render_to(const RenderTexture& target, std::span<const Command> commands)
        {
            backend_->render(commands, target.id());
        }

        void render_to(const RenderTexture& target, const CommandEncoder& encoder)
        {
            render_to(target, std::span<const Command>(encoder.commands()));
        }

        void set_buffer_data(const Buffer& buffer, std::span<const float> data)
        {
            set_buffer_bytes(buffer, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size_bytes()));
        }

        void set_buffer_data(const Buffer& buffer, std::span<const uint32_t> data)
        {
            set_buffer_bytes(buffer, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size_bytes()));
        }

        void set_buffer_bytes(const Buffer& buffer, std::span<const uint8_t> bytes)
        {
            backend_->set_buffer_data(buffer.id(), bytes);
        }

        size_t pending_drops() const { return drop_tracker_->size(); }

        // Хуримтлагдсан drop-уудыг нэг batch болгон backend руу өгнө.
        void clean()
        {
            if (drop_tracker_->empty()) return;
            const std::vector<ResourceId> batch = drop_tracker_->take_all();
            if (batch.empty()) return;
            log_debug("[ngfx] clean: releasing " + std::to_string(batch.size()) + " resources");
            backend_->clean(batch);
        }

    private:
        friend class PipelineBuilder;
        friend class VertexBufferBuilder;
        friend class IndexBufferBuilder;
        friend class UniformBufferBuilder;
        friend class TextureBuilder;
        friend class RenderTextureBuilder;
        friend class TextureUpdater;
        friend class TextureReader;

        Result<Pipeline> inner_create_pipeline(
            std::span<const uint8_t> vertex_source,
            std::span<const uint8_t> fragment_source,
            std::span<const VertexAttr> attrs,
            const PipelineOptions& options)
        {
            if (vertex_source.empty()) return Result<Pipeline>::failure("Error creating pipeline: missing vertex shader source.");
            if (fragment_source.empty()) return Result<Pipeline>::failure("Error creating pipeline: missing fragment shader source.");
            if (attrs.empty()) return Result<Pipeline>::failure("Error creating pipeline: vertex attribute layout is empty.");

            const uint32_t stride = vertex_stride(attrs);
            Result<uint64_t> id = backend_->create_pipeline(vertex_source, fragment_source, attrs, options);
            if (!id.ok) return Result<Pipeline>::failure_from(id);
            return Result<Pipeline>::success(Pipeline(id.value, stride, options, drop_tracker_));
        }

        Result<Buffer> inner_create_vertex_buffer(std::span<const float> data, bool has_data, const VertexInfo& info)
        {
            if (info.attrs.empty()) return Result<Buffer>::failure("Error creating vertex buffer: vertex attribute layout is empty.");

            Result<uint64_t> id = backend_->create_vertex_buffer(info.attrs, info.step_mode);
            if (!id.ok) return Result<Buffer>::failure_from(id);

            Buffer buffer(id.value, BufferUsage::Vertex, std::nullopt, make_vertex_layout(info.attrs, info.step_mode), drop_tracker_);
            if (has_data) set_buffer_data(buffer, data);
            return Result<Buffer>::success(std::move(buffer));
        }

        Result<Buffer> inner_create_index_buffer(std::span<const uint32_t> data, bool has_data)
        {
            Result<uint64_t> id = backend_->create_index_buffer();
            if (!id.ok) return Result<Buffer>::failure_from(id);

            Buffer buffer(id.value, BufferUsage::Index, std::nullopt, std::nullopt, drop_tracker_);
            if (has_data) set_buffer_data(buffer, data);
            return Result<Buffer>::success(std::move(buffer));
        }

        Result<Buffer> inner_create_uniform_buffer(uint32_t slot, const std::string& name, std::span<const float> data, bool has_data)
        {
            if (name.empty()) return Result<Buffer>::failure("Error creating uniform buffer: block name is empty.");
            const uint32_t max_block = backend_->limits().max_uniform_block_size;
            if (has_data && data.size_bytes() > (size_t)max_block)
            {
                return Result<Buffer>::failure("Error creating uniform buffer: " + std::to_string(data.size_bytes())
                    + " bytes exceeds max uniform block size " + std::to_string(max_block) + ".");
            }

            Result<uint64_t> id = backend_->create_uniform_buffer(slot, name);
            if (!id.ok) return Result<Buffer>::failure_from(id);

            Buffer buffer(id.value, BufferUsage::Uniform, slot, std::nullopt, drop_tracker_);
            if (has_data) set_buffer_data(buffer, data);
            return Result<Buffer>::success(std::move(buffer));
        }

        Status validate_texture_info(const TextureInfo& info, const char* what) const
        {
            if (info.width <= 0 || info.height <= 0)
            {
                return Status::failure(std::string("Error creating ") + what + ": invalid size "
                    + std::to_string(info.width) + "x" + std::to_string(info.height) + ".");
            }
            const Limits lim = limits();
            if (lim.max_texture_size > 0
                && ((uint32_t)info.width > lim.max_texture_size || (uint32_t)info.height > lim.max_texture_size))
            {
                return Status::failure(std::string("Error creating ") + what + ": size "
                    + std::to_string(info.width) + "x" + std::to_string(info.height)
                    + " exceeds max texture size " + std::to_string(lim.max_texture_size) + ".");
            }
            if (!info.bytes.empty() && !texture_format_is_depth(info.format)
                && info.bytes.size() < texture_byte_size(info.width, info.height, info.format))
            {
                return Status::failure(std::string("Error creating ") + what + ": expected "
                    + std::to_string(texture_byte_size(info.width, info.height, info.format))
                    + " bytes of pixel data, got " + std::to_string(info.bytes.size()) + ".");
            }
            return Status::success();
        }

        Result<Texture> inner_create_texture(TextureInfo info)
        {
            const Status valid = validate_texture_info(info, "texture");
            if (!valid.ok) return Result<Texture>::failure(valid.error, valid.code);
            if (texture_format_is_depth(info.format) && !info.bytes.empty())
            {
                log_warn("[ngfx] depth texture initial bytes are ignored");
            }

            Result<uint64_t> id = backend_->create_texture(info);
            if (!id.ok) return Result<Texture>::failure_from(id);

            info.bytes.clear();
            return Result<Texture>::success(Texture(id.value, std::move(info), drop_tracker_));
        }

        Result<RenderTexture> inner_create_render_texture(TextureInfo info)
        {
            const Status valid = validate_texture_info(info, "render texture");
            if (!valid.ok) return Result<RenderTexture>::failure(valid.error, valid.code);
            if (texture_format_is_depth(info.format))
            {
                return Result<RenderTexture>::failure("Error creating render texture: color attachment cannot use a depth format.");
            }

            Result<uint64_t> tex_id = backend_->create_texture(info);
            if (!tex_id.ok) return Result<RenderTexture>::failure_from(tex_id);

            Result<uint64_t> rt_id = backend_->create_render_texture(tex_id.value, info);
            if (!rt_id.ok)
            {
                // Color texture-г handle болгоогүй тул шууд устгана.
                const ResourceId rollback[] = {ResourceId::texture(tex_id.value)};
                backend_->clean(rollback);
                return Result<RenderTexture>::failure_from(rt_id);
            }

            const bool has_depth = info.depth;
            info.bytes.clear();
            Texture texture(tex_id.value, std::move(info), drop_tracker_);
            return Result<RenderTexture>::success(RenderTexture(rt_id.value, std::move(texture), has_depth, drop_tracker_));
        }

        Status inner_update_texture(const Texture& texture, const TextureUpdate& opts)
        {
            const size_t needed = texture_byte_size(opts.width, opts.height, opts.format);
            if (needed == 0) return Status::failure("Error updating texture: empty region.");
            if (opts.bytes.size() < needed)
            {
                return Status::failure("Error updating texture: expected " + std::to_string(needed)
                    + " bytes, got " + std::to_string(opts.bytes.size()) + ".");
            }
            return backend_->update_texture(texture.id(), opts);
        }

        Status inner_read_pixels(const Texture& texture, std::span<uint8_t> bytes, const TextureRead& opts)
        {
            const size_t needed = texture_byte_size(opts.width, opts.height, opts.format);
            if (needed == 0) return Status::failure("Error reading pixels: empty region.");
            if (bytes.size() < needed)
            {
                return Status::failure("Error reading pixels: destination holds " + std::to_string(bytes.size())
                    + " bytes, " + std::to_string(needed) + " required.");
            }
            return backend_->read_pixels(texture.id(), bytes, opts);
        }

        std::unique_ptr<IDeviceBackend> backend_{};
        std::shared_ptr<DropTracker> drop_tracker_{};
        int width_ = 1;
        int height_ = 1;
        double dpi_ = 1.0;
    };

    inline Result<Pipeline> PipelineBuilder::build()
    {
        return device_->inner_create_pipeline(vertex_, fragment_, attrs_, options_);
    }

    inline Result<Buffer> VertexBufferBuilder::build()
    {
        return device_->inner_create_vertex_buffer(data_, has_data_, info_);
    }

    inline Result<Buffer> IndexBufferBuilder::build()
    {
        return device_->inner_create_index_buffer(data_, has_data_);
    }

    inline Result<Buffer> UniformBufferBuilder::build()
    {
        return device_->inner_create_uniform_buffer(slot_, name_, data_, has_data_);
    }

    inline Result<Texture> TextureBuilder::build()
    {
        return device_->inner_create_texture(info_);
    }

    inline Result<RenderTexture> RenderTextureBuilder::build()
    {
        return device_->inner_create_render_texture(info_);
    }

    inline Status TextureUpdater::update()
    {
        return device_->inner_update_texture(*texture_, opts_);
    }

    inline Status TextureReader::read_to(std::span<uint8_t> bytes)
    {
        return device_->inner_read_pixels(*texture_, bytes, opts_);
    }
}
