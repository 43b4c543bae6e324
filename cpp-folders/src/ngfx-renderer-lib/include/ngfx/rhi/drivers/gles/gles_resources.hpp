#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: gles_resources.hpp
    МОДУЛЬ: rhi/drivers/gles
    ЗОРИЛГО: GLES backend-ийн native resource бичлэгүүд (program/VAO, buffer, texture, FBO)
            болон тэдгээрийг үүсгэх/устгах helper-ууд.
*/


#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ngfx/core/log.hpp"
#include "ngfx/core/result.hpp"
#include "ngfx/gfx/buffer.hpp"
#include "ngfx/gfx/pipeline.hpp"
#include "ngfx/gfx/texture.hpp"
#include "ngfx/rhi/drivers/gles/gles_api.hpp"
#include "ngfx/rhi/drivers/gles/gles_convert.hpp"

namespace ngfx::gles
{
    // Texture unit 0..7
    constexpr uint32_t k_max_texture_slots = 8;

    struct GlesPipeline
    {
        GLuint program = 0;
        GLuint vao = 0;
        uint32_t stride = 0;
        // Block-оос гадуурх active uniform-уудын location (enumeration дарааллаар).
        std::vector<GLint> uniform_locations{};
        // VAO-ийн attribute location бүр аль buffer-ээс уншиж байгаа.
        std::unordered_map<GLuint, GLuint> attr_sources{};
        // Үүсгэх үед өгсөн render state.
        PipelineOptions options{};
    };

    struct GlesBuffer
    {
        GLuint buffer = 0;
        BufferUsage usage = BufferUsage::Vertex;
        size_t size = 0;
        std::optional<VertexLayout> layout{};
        uint32_t uniform_slot = 0;
        std::string block_name{};
        // Uniform block binding-ийг аль хэдийн тогтоосон program-ууд.
        std::vector<GLuint> block_bound_programs{};
    };

    struct GlesTexture
    {
        GLuint texture = 0;
        int width = 0;
        int height = 0;
        TextureFormat format = TextureFormat::Rgba32;
    };

    struct GlesRenderTarget
    {
        GLuint fbo = 0;
        uint64_t color_texture_id = 0;
        std::optional<GLuint> depth_texture{};
        int width = 0;
        int height = 0;
    };

    inline GLenum buffer_target(BufferUsage usage)
    {
        switch (usage)
        {
            case BufferUsage::Vertex: return GL_ARRAY_BUFFER;
            case BufferUsage::Index: return GL_ELEMENT_ARRAY_BUFFER;
            case BufferUsage::Uniform: return GL_UNIFORM_BUFFER;
        }
        return GL_ARRAY_BUFFER;
    }

    inline std::string shader_info_log(const GlesApi& gl, GLuint shader)
    {
        GLint len = 0;
        gl.GetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
        if (len <= 0) return {};
        std::string out((size_t)len, '\0');
        GLsizei written = 0;
        gl.GetShaderInfoLog(shader, len, &written, out.data());
        out.resize((size_t)std::max<GLsizei>(0, std::min<GLsizei>(written, len)));
        return out;
    }

    inline std::string program_info_log(const GlesApi& gl, GLuint program)
    {
        GLint len = 0;
        gl.GetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
        if (len <= 0) return {};
        std::string out((size_t)len, '\0');
        GLsizei written = 0;
        gl.GetProgramInfoLog(program, len, &written, out.data());
        out.resize((size_t)std::max<GLsizei>(0, std::min<GLsizei>(written, len)));
        return out;
    }

    inline Result<GLuint> compile_shader(const GlesApi& gl, GLenum stage, std::span<const uint8_t> source)
    {
        const GLuint shader = gl.CreateShader(stage);
        const GLchar* src = reinterpret_cast<const GLchar*>(source.data());
        const GLint len = (GLint)source.size();
        gl.ShaderSource(shader, 1, &src, &len);
        gl.CompileShader(shader);

        GLint status = 0;
        gl.GetShaderiv(shader, GL_COMPILE_STATUS, &status);
        if (status == GL_TRUE) return Result<GLuint>::success(shader);

        const std::string log = shader_info_log(gl, shader);
        gl.DeleteShader(shader);
        const char* stage_name = stage == GL_VERTEX_SHADER ? "vertex" : "fragment";
        const std::string text(reinterpret_cast<const char*>(source.data()), source.size());
        return Result<GLuint>::failure(log + " with " + stage_name + " shader: \n--\n" + text + "\n--\n");
    }

    // Shader-ууд program-д холбогдсоны дараа устгагдана (program амьд байх хугацаанд GL хадгална).
    inline Result<GLuint> link_program(const GlesApi& gl, GLuint vertex, GLuint fragment)
    {
        const GLuint program = gl.CreateProgram();
        gl.AttachShader(program, vertex);
        gl.AttachShader(program, fragment);
        gl.LinkProgram(program);
        gl.DeleteShader(vertex);
        gl.DeleteShader(fragment);

        GLint status = 0;
        gl.GetProgramiv(program, GL_LINK_STATUS, &status);
        if (status == GL_TRUE) return Result<GLuint>::success(program);

        const std::string log = program_info_log(gl, program);
        gl.DeleteProgram(program);
        return Result<GLuint>::failure(log);
    }

    inline std::vector<GLint> collect_uniform_locations(const GlesApi& gl, GLuint program)
    {
        GLint count = 0;
        gl.GetProgramiv(program, GL_ACTIVE_UNIFORMS, &count);
        GLint max_len = 0;
        gl.GetProgramiv(program, GL_ACTIVE_UNIFORM_MAX_LENGTH, &max_len);

        std::vector<GLint> out{};
        std::string name((size_t)std::max<GLint>(max_len, 1), '\0');
        for (GLint i = 0; i < count; ++i)
        {
            GLsizei length = 0;
            GLint size = 0;
            GLenum type = 0;
            gl.GetActiveUniform(program, (GLuint)i, (GLsizei)name.size(), &length, &size, &type, name.data());
            const std::string uniform_name = name.substr(0, (size_t)std::max<GLsizei>(0, length));

            // Uniform block-ийн гишүүд -1 буцаана.
            const GLint loc = gl.GetUniformLocation(program, uniform_name.c_str());
            if (loc < 0)
            {
                log_debug("[ngfx][gles] uniform without location skipped: " + uniform_name);
                continue;
            }
            out.push_back(loc);
        }
        return out;
    }

    inline Result<GlesPipeline> create_pipeline(
        const GlesApi& gl,
        std::span<const uint8_t> vertex_source,
        std::span<const uint8_t> fragment_source,
        uint32_t stride)
    {
        Result<GLuint> vs = compile_shader(gl, GL_VERTEX_SHADER, vertex_source);
        if (!vs.ok) return Result<GlesPipeline>::failure_from(vs);

        Result<GLuint> fs = compile_shader(gl, GL_FRAGMENT_SHADER, fragment_source);
        if (!fs.ok)
        {
            gl.DeleteShader(vs.value);
            return Result<GlesPipeline>::failure_from(fs);
        }

        Result<GLuint> program = link_program(gl, vs.value, fs.value);
        if (!program.ok) return Result<GlesPipeline>::failure_from(program);

        GlesPipeline out{};
        out.program = program.value;
        out.stride = stride;
        out.uniform_locations = collect_uniform_locations(gl, out.program);
        gl.GenVertexArrays(1, &out.vao);
        return Result<GlesPipeline>::success(std::move(out));
    }

    inline void destroy_pipeline(const GlesApi& gl, const GlesPipeline& pip)
    {
        gl.DeleteVertexArrays(1, &pip.vao);
        gl.DeleteProgram(pip.program);
    }

    // Pipeline-ийн VAO дээр buffer-ийн layout-аар attribute pointer-уудыг тогтооно.
    // Buffer нь GL_ARRAY_BUFFER дээр bind хийгдсэн байх ёстой.
    inline void specify_vertex_attributes(const GlesApi& gl, GlesPipeline& pip, const GlesBuffer& buf)
    {
        if (!buf.layout) return;
        const VertexLayout& layout = *buf.layout;
        const GLuint divisor = layout.step_mode == VertexStepMode::Instance ? 1u : 0u;
        for (const VertexAttrLayout& a : layout.attrs)
        {
            gl.EnableVertexAttribArray(a.location);
            gl.VertexAttribPointer(
                a.location,
                (GLint)a.components,
                to_gl_attr_type(a.format),
                a.normalized ? GL_TRUE : GL_FALSE,
                (GLsizei)layout.stride,
                reinterpret_cast<const void*>((uintptr_t)a.offset));
            gl.VertexAttribDivisor(a.location, divisor);
            pip.attr_sources[a.location] = buf.buffer;
        }
    }

    inline bool vertex_attributes_current(const GlesPipeline& pip, const GlesBuffer& buf)
    {
        if (!buf.layout) return true;
        for (const VertexAttrLayout& a : buf.layout->attrs)
        {
            const auto it = pip.attr_sources.find(a.location);
            if (it == pip.attr_sources.end() || it->second != buf.buffer) return false;
        }
        return true;
    }

    // Хэмжээ өөрчлөгдвөл storage дахин нөөцөлнө, үгүй бол байрандаа бичнэ.
    inline void upload_buffer(const GlesApi& gl, GlesBuffer& buf, std::span<const uint8_t> data)
    {
        const GLenum target = buffer_target(buf.usage);
        gl.BindBuffer(target, buf.buffer);
        if (data.size() != buf.size)
        {
            gl.BufferData(target, (GLsizeiptr)data.size(), data.data(), GL_DYNAMIC_DRAW);
            buf.size = data.size();
        }
        else if (!data.empty())
        {
            gl.BufferSubData(target, 0, (GLsizeiptr)data.size(), data.data());
        }
    }

    inline void bind_uniform_block(const GlesApi& gl, GlesBuffer& buf, GLuint program)
    {
        if (std::find(buf.block_bound_programs.begin(), buf.block_bound_programs.end(), program) != buf.block_bound_programs.end())
        {
            return;
        }
        const GLuint index = gl.GetUniformBlockIndex(program, buf.block_name.c_str());
        if (index != GL_INVALID_INDEX)
        {
            gl.UniformBlockBinding(program, index, buf.uniform_slot);
        }
        else
        {
            log_debug("[ngfx][gles] uniform block not found in program: " + buf.block_name);
        }
        buf.block_bound_programs.push_back(program);
    }

    // Depth format бол filter-ийг nearest болгож, одоо bind хийгдсэн framebuffer-ийн
    // depth attachment-д шууд холбоно.
    inline GlesTexture create_texture(const GlesApi& gl, const TextureInfo& info)
    {
        GlesTexture out{};
        out.width = info.width;
        out.height = info.height;
        out.format = info.format;

        gl.GenTextures(1, &out.texture);
        gl.BindTexture(GL_TEXTURE_2D, out.texture);

        const uint32_t bpp = info.bytes_per_pixel();
        if (bpp != 4) gl.PixelStorei(GL_UNPACK_ALIGNMENT, (GLint)bpp);

        const bool depth = texture_format_is_depth(info.format);
        const GLenum min_filter = depth ? GL_NEAREST : to_gl(info.min_filter);
        const GLenum mag_filter = depth ? GL_NEAREST : to_gl(info.mag_filter);
        gl.TexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, (GLint)min_filter);
        gl.TexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, (GLint)mag_filter);
        gl.TexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        gl.TexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

        const void* pixels = (!depth && !info.bytes.empty()) ? info.bytes.data() : nullptr;
        gl.TexImage2D(
            GL_TEXTURE_2D,
            0,
            to_gl_internal_format(info.format),
            info.width,
            info.height,
            0,
            to_gl_format(info.format),
            to_gl_pixel_type(info.format),
            pixels);

        if (depth)
        {
            gl.FramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_TEXTURE_2D, out.texture, 0);
        }

        if (bpp != 4) gl.PixelStorei(GL_UNPACK_ALIGNMENT, 4);
        gl.BindTexture(GL_TEXTURE_2D, 0);
        return out;
    }

    inline void update_texture(const GlesApi& gl, const GlesTexture& tex, const TextureUpdate& opts)
    {
        gl.BindTexture(GL_TEXTURE_2D, tex.texture);
        const uint32_t bpp = texture_format_bytes_per_pixel(opts.format);
        if (bpp != 4) gl.PixelStorei(GL_UNPACK_ALIGNMENT, (GLint)bpp);
        gl.TexSubImage2D(
            GL_TEXTURE_2D,
            0,
            opts.x_offset,
            opts.y_offset,
            opts.width,
            opts.height,
            to_gl_format(opts.format),
            to_gl_pixel_type(opts.format),
            opts.bytes.data());
        if (bpp != 4) gl.PixelStorei(GL_UNPACK_ALIGNMENT, 4);
        gl.BindTexture(GL_TEXTURE_2D, 0);
    }

    inline void bind_texture(const GlesApi& gl, const GlesTexture& tex, uint32_t slot, GLint location)
    {
        gl.ActiveTexture(GL_TEXTURE0 + slot);
        gl.BindTexture(GL_TEXTURE_2D, tex.texture);
        gl.Uniform1i(location, (GLint)slot);
    }
}
