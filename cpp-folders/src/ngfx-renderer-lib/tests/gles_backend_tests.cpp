#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ngfx/core/log.hpp"
#include "ngfx/gfx/device.hpp"
#include "ngfx/rhi/drivers/gles/gles_backend.hpp"

#include "fake_gles.hpp"

namespace
{
    using ngfx_test::fake_gl;

    const char* kVs = "#version 300 es\nlayout(location = 0) in vec3 a_pos;\nvoid main() { gl_Position = vec4(a_pos, 1.0); }\n";
    const char* kFs = "#version 300 es\nprecision mediump float;\nout vec4 c;\nvoid main() { c = vec4(1.0); }\n";

    std::span<const uint8_t> bytes_of(const char* text)
    {
        return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text), std::strlen(text));
    }

    ngfx::GlesBackendDesc fake_desc(int w = 1280, int h = 720, double dpi = 1.0)
    {
        ngfx::GlesBackendDesc desc{};
        desc.loader = [](const char* name) { return ngfx_test::fake_gl_resolve(name); };
        desc.width = w;
        desc.height = h;
        desc.dpi = dpi;
        return desc;
    }

    std::unique_ptr<ngfx::GlesDeviceBackend> make_backend(const ngfx::GlesBackendDesc& desc)
    {
        ngfx::Result<std::unique_ptr<ngfx::GlesDeviceBackend>> r = ngfx::GlesDeviceBackend::create(desc);
        if (!r.ok) return nullptr;
        return std::move(r.value);
    }

    std::vector<ngfx::VertexAttr> position_attrs()
    {
        return {ngfx::VertexAttr{0, ngfx::VertexFormat::Float32x3}};
    }

    std::optional<uint64_t> make_pipeline(ngfx::GlesDeviceBackend& backend)
    {
        const std::vector<ngfx::VertexAttr> attrs = position_attrs();
        ngfx::Result<uint64_t> r = backend.create_pipeline(bytes_of(kVs), bytes_of(kFs), attrs, ngfx::PipelineOptions{});
        if (!r.ok) return std::nullopt;
        return r.value;
    }

    bool is_attribute_setup(const std::string& name)
    {
        return name == "glEnableVertexAttribArray" || name == "glVertexAttribPointer" || name == "glVertexAttribDivisor";
    }

    // Сүүлд үүсгэсэн GL нэрийг Gen* дуудлагын бичлэгээс авна.
    GLuint last_generated(const char* gen_name)
    {
        const ngfx_test::GlCall* c = fake_gl().last(gen_name);
        return c ? (GLuint)c->args[1] : 0;
    }

    bool test_missing_entry_points_reported()
    {
        fake_gl().reset();
        fake_gl().missing = {"glScissor", "glDrawElementsInstanced"};
        ngfx::Result<std::unique_ptr<ngfx::GlesDeviceBackend>> r = ngfx::GlesDeviceBackend::create(fake_desc());
        if (r.ok) return false;
        if (r.error.find("Missing OpenGL ES entry points") == std::string::npos) return false;
        if (r.error.find("glScissor") == std::string::npos) return false;
        if (r.error.find("glDrawElementsInstanced") == std::string::npos) return false;

        ngfx::GlesBackendDesc empty{};
        return !ngfx::GlesDeviceBackend::create(empty).ok;
    }

    bool test_limits_queried_from_driver()
    {
        fake_gl().reset();
        fake_gl().max_texture_size = 1234;
        fake_gl().max_uniform_block_size = 65536;
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const ngfx::Limits lim = backend->limits();
        return lim.max_texture_size == 1234 && lim.max_uniform_block_size == 65536
            && backend->type() == ngfx::DeviceBackendType::OpenGLES
            && std::string(backend->name()) == "gles";
    }

    bool test_scissor_and_viewport_follow_frame()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc(1280, 720, 1.0));
        if (!backend) return false;

        const std::vector<ngfx::Command> cmds{ngfx::CmdBegin{}, ngfx::CmdSetScissor{10.0f, 10.0f, 100.0f, 50.0f}, ngfx::CmdEnd{}};
        backend->render(cmds, std::nullopt);
        if (fake_gl().count("glViewport", {0, 0, 1280, 720}) != 1) return false;
        if (fake_gl().count("glEnable", {GL_SCISSOR_TEST}) != 1) return false;
        if (fake_gl().count("glScissor", {10, 660, 100, 50}) != 1) return false;

        // Default surface дээр dpi-аар өсгөнө.
        backend->set_dpi(2.0);
        backend->render(cmds, std::nullopt);
        if (fake_gl().count("glViewport", {0, 0, 2560, 1440}) != 1) return false;
        if (fake_gl().count("glScissor", {20, 1320, 200, 100}) != 1) return false;

        // Offscreen target-ийн хэмжээ ба dpi 1.0.
        ngfx::TextureInfo info{};
        info.width = 64;
        info.height = 32;
        ngfx::Result<uint64_t> tex = backend->create_texture(info);
        ngfx::Result<uint64_t> rt = backend->create_render_texture(tex.value, info);
        if (!tex.ok || !rt.ok) return false;
        const std::vector<ngfx::Command> rt_cmds{
            ngfx::CmdBegin{}, ngfx::CmdSetScissor{0.0f, 0.0f, 10.0f, 10.0f}, ngfx::CmdSetViewport{0.0f, 0.0f, 32.0f, 16.0f}, ngfx::CmdEnd{}};
        backend->render(rt_cmds, rt.value);
        const GLuint fbo = last_generated("glGenFramebuffers");
        if (fake_gl().count("glBindFramebuffer", {GL_FRAMEBUFFER, (double)fbo}) < 2) return false;
        if (fake_gl().count("glViewport", {0, 0, 64, 32}) != 1) return false;
        if (fake_gl().count("glScissor", {0, 22, 10, 10}) != 1) return false;
        return fake_gl().count("glViewport", {0, 0, 32, 16}) == 1;
    }

    bool test_noop_stencil_disables_test()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        if (!pip) return false;

        ngfx::PipelineOptions opts{};
        opts.stencil = ngfx::StencilOptions{};
        backend->render(std::vector<ngfx::Command>{ngfx::CmdBegin{}, ngfx::CmdSetPipeline{*pip, opts}, ngfx::CmdEnd{}}, std::nullopt);
        if (fake_gl().count("glDisable", {GL_STENCIL_TEST}) != 1) return false;
        if (fake_gl().count("glStencilFunc") != 0 || fake_gl().count("glStencilOp") != 0) return false;

        ngfx::StencilOptions mark{};
        mark.pass = ngfx::StencilAction::Replace;
        mark.reference = 1;
        mark.write_mask = 0xff;
        opts.stencil = mark;
        backend->render(std::vector<ngfx::Command>{ngfx::CmdBegin{}, ngfx::CmdSetPipeline{*pip, opts}, ngfx::CmdEnd{}}, std::nullopt);
        return fake_gl().count("glEnable", {GL_STENCIL_TEST}) == 1
            && fake_gl().count("glStencilMask", {0xff}) == 1
            && fake_gl().count("glStencilOp", {GL_KEEP, GL_KEEP, GL_REPLACE}) == 1
            && fake_gl().count("glStencilFunc", {GL_ALWAYS, 1, 0xff}) == 1;
    }

    bool test_blend_call_selection()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        if (!pip) return false;

        ngfx::PipelineOptions color_only{};
        color_only.color_blend = ngfx::BlendMode::NORMAL;
        backend->render(std::vector<ngfx::Command>{ngfx::CmdSetPipeline{*pip, color_only}}, std::nullopt);
        if (fake_gl().count("glEnable", {GL_BLEND}) != 1) return false;
        if (fake_gl().count("glBlendFunc", {GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA}) != 1) return false;
        if (fake_gl().count("glBlendEquation", {GL_FUNC_ADD}) != 1) return false;
        if (fake_gl().count("glBlendFuncSeparate") != 0) return false;

        ngfx::PipelineOptions both = color_only;
        both.alpha_blend = ngfx::BlendMode::ADD;
        backend->render(std::vector<ngfx::Command>{ngfx::CmdSetPipeline{*pip, both}}, std::nullopt);
        if (fake_gl().count("glBlendFuncSeparate", {GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE}) != 1) return false;
        if (fake_gl().count("glBlendEquationSeparate", {GL_FUNC_ADD, GL_FUNC_ADD}) != 1) return false;

        backend->render(std::vector<ngfx::Command>{ngfx::CmdSetPipeline{*pip, ngfx::PipelineOptions{}}}, std::nullopt);
        return fake_gl().count("glDisable", {GL_BLEND}) == 1
            && fake_gl().count("glDisable", {GL_DEPTH_TEST}) == 3
            && fake_gl().count("glDepthMask", {GL_FALSE}) == 3;
    }

    bool test_depth_attachment_uses_nearest()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        ngfx::TextureInfo info{};
        info.width = 16;
        info.height = 16;
        info.depth = true;
        ngfx::Result<uint64_t> tex = backend->create_texture(info);
        if (!tex.ok) return false;
        const GLuint color = last_generated("glGenTextures");
        ngfx::Result<uint64_t> rt = backend->create_render_texture(tex.value, info);
        if (!rt.ok || rt.value != 1) return false;
        const GLuint depth = last_generated("glGenTextures");
        if (depth == color) return false;

        if (fake_gl().count("glTexParameteri", {GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST}) != 1) return false;
        if (fake_gl().count("glTexParameteri", {GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST}) != 1) return false;
        if (fake_gl().count("glTexImage2D", {GL_TEXTURE_2D, 0, GL_DEPTH_COMPONENT16, 16, 16, 0, GL_DEPTH_COMPONENT, GL_UNSIGNED_SHORT, 0}) != 1) return false;
        if (fake_gl().count("glFramebufferTexture2D", {GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, (double)color, 0}) != 1) return false;
        if (fake_gl().count("glFramebufferTexture2D", {GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_TEXTURE_2D, (double)depth, 0}) != 1) return false;

        // Шинэ target тунгалаг өнгөөр цэвэрлэгдэж, default framebuffer руу буцна.
        if (fake_gl().count("glClearColor", {0, 0, 0, 0}) != 1) return false;
        if (fake_gl().count("glClear", {GL_COLOR_BUFFER_BIT}) != 1) return false;
        return fake_gl().calls.back().name == "glBindFramebuffer" && fake_gl().calls.back().args == std::vector<double>{GL_FRAMEBUFFER, 0};
    }

    bool test_r8_texture_unpack_alignment()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        ngfx::TextureInfo info{};
        info.width = 3;
        info.height = 3;
        info.format = ngfx::TextureFormat::R8;
        info.min_filter = ngfx::TextureFilter::Nearest;
        info.bytes.assign(9, 7);
        ngfx::Result<uint64_t> tex = backend->create_texture(info);
        if (!tex.ok) return false;

        const long set = fake_gl().index_of("glPixelStorei", {GL_UNPACK_ALIGNMENT, 1});
        const long upload = fake_gl().index_of("glTexImage2D", {GL_TEXTURE_2D, 0, GL_R8, 3, 3, 0, GL_RED, GL_UNSIGNED_BYTE, 1});
        const long restore = fake_gl().index_of("glPixelStorei", {GL_UNPACK_ALIGNMENT, 4});
        if (set < 0 || upload < set || restore < upload) return false;
        if (fake_gl().count("glTexParameteri", {GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST}) != 1) return false;
        if (fake_gl().count("glTexParameteri", {GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR}) != 1) return false;

        ngfx::TextureUpdate upd{};
        upd.x_offset = 1;
        upd.y_offset = 1;
        upd.width = 2;
        upd.height = 2;
        upd.format = ngfx::TextureFormat::R8;
        upd.bytes.assign(4, 9);
        if (!backend->update_texture(tex.value, upd).ok) return false;
        if (fake_gl().count("glTexSubImage2D", {GL_TEXTURE_2D, 0, 1, 1, 2, 2, GL_RED, GL_UNSIGNED_BYTE, 1}) != 1) return false;

        const ngfx::Status missing = backend->update_texture(99, upd);
        return !missing.ok && missing.code == ngfx::ErrorCode::InvalidHandleLookup;
    }

    bool test_render_target_failure_releases_objects()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        ngfx::TextureInfo info{};
        info.width = 8;
        info.height = 8;
        info.depth = true;
        ngfx::Result<uint64_t> tex = backend->create_texture(info);
        if (!tex.ok) return false;

        fake_gl().framebuffer_status = GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT;
        ngfx::Result<uint64_t> rt = backend->create_render_texture(tex.value, info);
        if (rt.ok || rt.code != ngfx::ErrorCode::FramebufferIncomplete) return false;
        if (!fake_gl().framebuffers.empty()) return false;
        // Зөвхөн өнгөний texture үлдэнэ.
        if (fake_gl().textures.size() != 1) return false;
        if (backend->contains(ngfx::ResourceId::render_texture(1))) return false;

        ngfx::Result<uint64_t> orphan = backend->create_render_texture(42, info);
        return !orphan.ok;
    }

    bool test_read_pixels_framebuffer_lifecycle()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        ngfx::TextureInfo info{};
        info.width = 4;
        info.height = 4;
        info.format = ngfx::TextureFormat::R8;
        ngfx::Result<uint64_t> tex = backend->create_texture(info);
        if (!tex.ok) return false;

        std::vector<uint8_t> px(16, 0);
        ngfx::TextureRead read{};
        read.width = 4;
        read.height = 4;
        read.format = ngfx::TextureFormat::R8;
        if (!backend->read_pixels(tex.value, px, read).ok) return false;
        if (fake_gl().count("glReadPixels", {0, 0, 4, 4, GL_RED, GL_UNSIGNED_BYTE}) != 1) return false;
        if (fake_gl().count("glPixelStorei", {GL_PACK_ALIGNMENT, 1}) != 1) return false;
        if (fake_gl().count("glPixelStorei", {GL_PACK_ALIGNMENT, 4}) != 1) return false;
        if (!fake_gl().framebuffers.empty()) return false;

        fake_gl().framebuffer_status = GL_FRAMEBUFFER_UNSUPPORTED;
        const ngfx::Status st = backend->read_pixels(tex.value, px, read);
        if (st.ok || st.code != ngfx::ErrorCode::FramebufferIncomplete) return false;
        if (fake_gl().count("glReadPixels") != 1) return false;
        if (fake_gl().count("glDeleteFramebuffers") != 2 || !fake_gl().framebuffers.empty()) return false;

        const ngfx::Status unknown = backend->read_pixels(77, px, read);
        return !unknown.ok && unknown.code == ngfx::ErrorCode::InvalidHandleLookup;
    }

    bool test_shader_errors_carry_source()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        fake_gl().fail_compile_stage = GL_FRAGMENT_SHADER;
        fake_gl().compile_log = "0:3: 'c' : undeclared identifier";
        const std::vector<ngfx::VertexAttr> attrs = position_attrs();
        ngfx::Result<uint64_t> r = backend->create_pipeline(bytes_of(kVs), bytes_of(kFs), attrs, ngfx::PipelineOptions{});
        if (r.ok) return false;
        const std::string expected = "0:3: 'c' : undeclared identifier with fragment shader: \n--\n" + std::string(kFs) + "\n--\n";
        if (r.error != expected) return false;
        if (!fake_gl().shaders.empty() || !fake_gl().programs.empty()) return false;

        fake_gl().fail_compile_stage = 0;
        fake_gl().fail_link = true;
        fake_gl().link_log = "error: varying mismatch";
        ngfx::Result<uint64_t> linked = backend->create_pipeline(bytes_of(kVs), bytes_of(kFs), attrs, ngfx::PipelineOptions{});
        if (linked.ok || linked.error != "error: varying mismatch") return false;
        if (!fake_gl().shaders.empty() || !fake_gl().programs.empty() || !fake_gl().vertex_arrays.empty()) return false;

        fake_gl().fail_link = false;
        ngfx::Result<uint64_t> good = backend->create_pipeline(bytes_of(kVs), bytes_of(kFs), attrs, ngfx::PipelineOptions{});
        // Link хийсний дараа shader-ууд устгагдсан байна.
        return good.ok && good.value == 1 && fake_gl().shaders.empty() && fake_gl().programs.size() == 1;
    }

    bool test_texture_binding_uses_uniform_locations()
    {
        fake_gl().reset();
        fake_gl().uniforms = {{"u_texture", 3}, {"u_mvp", -1}, {"u_mask", 5}};
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        ngfx::Result<uint64_t> tex = backend->create_texture(ngfx::TextureInfo{});
        if (!pip || !tex.ok) return false;
        const GLuint tex_name = last_generated("glGenTextures");

        const std::vector<ngfx::Command> cmds{
            ngfx::CmdBegin{},
            ngfx::CmdSetPipeline{*pip, ngfx::PipelineOptions{}},
            ngfx::CmdBindTexture{tex.value, 1, 1},
            ngfx::CmdBindTexture{tex.value, 8, 0},
            ngfx::CmdBindTexture{tex.value, 2, 2},
            ngfx::CmdBindTexture{99, 0, 0},
            ngfx::CmdEnd{}};
        backend->render(cmds, std::nullopt);

        if (fake_gl().count("glActiveTexture") != 1) return false;
        if (fake_gl().count("glActiveTexture", {GL_TEXTURE0 + 1}) != 1) return false;
        if (fake_gl().count("glBindTexture", {GL_TEXTURE_2D, (double)tex_name}) < 2) return false;
        return fake_gl().count("glUniform1i") == 1 && fake_gl().count("glUniform1i", {5, 1}) == 1;
    }

    bool test_vertex_attributes_cached_per_source()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        const std::vector<ngfx::VertexAttr> attrs = position_attrs();
        ngfx::Result<uint64_t> a = backend->create_vertex_buffer(attrs, ngfx::VertexStepMode::Vertex);
        ngfx::Result<uint64_t> b = backend->create_vertex_buffer(attrs, ngfx::VertexStepMode::Vertex);
        if (!pip || !a.ok || !b.ok) return false;

        auto frame = [&](uint64_t buffer, int binds) {
            std::vector<ngfx::Command> cmds{ngfx::CmdBegin{}, ngfx::CmdSetPipeline{*pip, ngfx::PipelineOptions{}}};
            for (int i = 0; i < binds; ++i) cmds.push_back(ngfx::CmdBindBuffer{buffer});
            cmds.push_back(ngfx::CmdEnd{});
            backend->render(cmds, std::nullopt);
            return fake_gl().count("glVertexAttribPointer");
        };

        if (frame(a.value, 2) != 1) return false;
        if (frame(a.value, 1) != 1) return false;
        if (frame(b.value, 1) != 2) return false;
        if (frame(a.value, 1) != 3) return false;
        if (fake_gl().count("glVertexAttribPointer", {0, 3, GL_FLOAT, GL_FALSE, 12, 0}) != 3) return false;

        const std::vector<ngfx::VertexAttr> inst_attrs{ngfx::VertexAttr{1, ngfx::VertexFormat::Float32x2}};
        ngfx::Result<uint64_t> inst = backend->create_vertex_buffer(inst_attrs, ngfx::VertexStepMode::Instance);
        if (!inst.ok) return false;
        frame(inst.value, 1);
        if (fake_gl().count("glVertexAttribDivisor", {1, 1}) != 1) return false;

        // Buffer устсаны дараа ижил нэр дахин гарсан ч дахин тодорхойлно.
        const std::vector<ngfx::ResourceId> gone{ngfx::ResourceId::buffer(a.value)};
        backend->clean(gone);
        return frame(b.value, 1) == 5;
    }

    bool test_uniform_block_bound_once_per_program()
    {
        fake_gl().reset();
        fake_gl().uniform_block_index = 4;
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        ngfx::Result<uint64_t> ubo = backend->create_uniform_buffer(2, "Locals");
        if (!pip || !ubo.ok) return false;
        const GLuint program = (GLuint)fake_gl().last("glCreateProgram")->args[0];
        const GLuint ubo_name = last_generated("glGenBuffers");

        const std::vector<ngfx::Command> cmds{
            ngfx::CmdBegin{}, ngfx::CmdSetPipeline{*pip, ngfx::PipelineOptions{}}, ngfx::CmdBindBuffer{ubo.value}, ngfx::CmdEnd{}};
        backend->render(cmds, std::nullopt);
        backend->render(cmds, std::nullopt);

        if (fake_gl().count("glGetUniformBlockIndex") != 1) return false;
        if (fake_gl().last("glGetUniformBlockIndex")->text != "Locals") return false;
        if (fake_gl().count("glUniformBlockBinding", {(double)program, 4, 2}) != 1) return false;
        if (fake_gl().count("glBindBufferBase", {GL_UNIFORM_BUFFER, 2, (double)ubo_name}) != 2) return false;

        // Өөр program дээр дахин холбоно, block олдохгүй бол binding алгасна.
        fake_gl().uniform_block_index = GL_INVALID_INDEX;
        const std::optional<uint64_t> other = make_pipeline(*backend);
        if (!other) return false;
        backend->render(std::vector<ngfx::Command>{
            ngfx::CmdBegin{}, ngfx::CmdSetPipeline{*other, ngfx::PipelineOptions{}}, ngfx::CmdBindBuffer{ubo.value}, ngfx::CmdEnd{}}, std::nullopt);
        return fake_gl().count("glGetUniformBlockIndex") == 2 && fake_gl().count("glUniformBlockBinding") == 1;
    }

    bool test_draw_call_selection()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::optional<uint64_t> pip = make_pipeline(*backend);
        ngfx::Result<uint64_t> ibo = backend->create_index_buffer();
        if (!pip || !ibo.ok) return false;
        const ngfx::CmdSetPipeline set{*pip, ngfx::PipelineOptions{}};

        backend->render(std::vector<ngfx::Command>{
            ngfx::CmdBegin{}, set, ngfx::CmdBindBuffer{ibo.value},
            ngfx::CmdDraw{ngfx::DrawPrimitive::Triangles, 2, 6},
            ngfx::CmdDrawInstanced{ngfx::DrawPrimitive::TriangleStrip, 1, 4, 3},
            ngfx::CmdEnd{}}, std::nullopt);
        if (fake_gl().count("glDrawElements", {GL_TRIANGLES, 6, GL_UNSIGNED_INT, 8}) != 1) return false;
        if (fake_gl().count("glDrawElementsInstanced", {GL_TRIANGLE_STRIP, 4, GL_UNSIGNED_INT, 4, 3}) != 1) return false;

        // End ба SetPipeline index төлөвийг цэвэрлэнэ.
        backend->render(std::vector<ngfx::Command>{
            ngfx::CmdBegin{}, set, ngfx::CmdDraw{ngfx::DrawPrimitive::Lines, 0, 2},
            ngfx::CmdBindBuffer{ibo.value}, set,
            ngfx::CmdDrawInstanced{ngfx::DrawPrimitive::LineStrip, 0, 5, 2},
            ngfx::CmdEnd{}}, std::nullopt);
        return fake_gl().count("glDrawArrays", {GL_LINES, 0, 2}) == 1
            && fake_gl().count("glDrawArraysInstanced", {GL_LINE_STRIP, 0, 5, 2}) == 1
            && fake_gl().count("glDrawElements") == 1;
    }

    bool test_begin_clear_and_end_reset()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc(320, 240, 1.0));
        if (!backend) return false;

        ngfx::CmdBegin begin{};
        begin.color = ngfx::Color::RED;
        begin.depth = 1.0f;
        begin.stencil = 0;
        backend->render(std::vector<ngfx::Command>{begin, ngfx::CmdEnd{}}, std::nullopt);

        if (fake_gl().count("glClearColor", {1, 0, 0, 1}) != 1) return false;
        if (fake_gl().count("glEnable", {GL_DEPTH_TEST}) != 1 || fake_gl().count("glDepthMask", {GL_TRUE}) != 1) return false;
        if (fake_gl().count("glClearDepthf", {1}) != 1) return false;
        if (fake_gl().count("glEnable", {GL_STENCIL_TEST}) != 1 || fake_gl().count("glStencilMask", {0xff}) != 1) return false;
        if (fake_gl().count("glClearStencil", {0}) != 1) return false;
        if (fake_gl().count("glClear", {GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT | GL_STENCIL_BUFFER_BIT}) != 1) return false;

        const long end = fake_gl().index_of("glDisable", {GL_SCISSOR_TEST});
        if (end < 0) return false;
        const std::vector<std::string> names = fake_gl().names();
        const std::vector<std::string> expected{
            "glDisable", "glBindBuffer", "glBindBuffer", "glBindBuffer", "glBindVertexArray", "glBindFramebuffer"};
        if (names.size() != (size_t)end + expected.size()) return false;
        for (size_t i = 0; i < expected.size(); ++i)
        {
            if (names[(size_t)end + i] != expected[i]) return false;
        }
        if (fake_gl().index_of("glBindBuffer", {GL_ELEMENT_ARRAY_BUFFER, 0}, (size_t)end) < 0) return false;
        if (fake_gl().index_of("glBindBuffer", {GL_UNIFORM_BUFFER, 0}, (size_t)end) < 0) return false;

        // Цэвэрлэх зүйлгүй Begin нь glClear дуудахгүй.
        const size_t clears = fake_gl().count("glClear");
        backend->render(std::vector<ngfx::Command>{ngfx::CmdBegin{}, ngfx::CmdEnd{}}, std::nullopt);
        return fake_gl().count("glClear") == clears;
    }

    bool test_buffer_upload_reuses_storage()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;
        const std::vector<ngfx::VertexAttr> attrs = position_attrs();
        ngfx::Result<uint64_t> vbo = backend->create_vertex_buffer(attrs, ngfx::VertexStepMode::Vertex);
        if (!vbo.ok) return false;

        std::vector<uint8_t> data(12, 1);
        backend->set_buffer_data(vbo.value, data);
        backend->set_buffer_data(vbo.value, data);
        data.resize(16);
        backend->set_buffer_data(vbo.value, data);
        backend->set_buffer_data(555, data);

        return fake_gl().count("glBufferData", {GL_ARRAY_BUFFER, 12, GL_DYNAMIC_DRAW}) == 1
            && fake_gl().count("glBufferSubData", {GL_ARRAY_BUFFER, 0, 12}) == 1
            && fake_gl().count("glBufferData", {GL_ARRAY_BUFFER, 16, GL_DYNAMIC_DRAW}) == 1
            && fake_gl().count("glBufferData") == 2;
    }

    bool test_clean_and_teardown_release_objects()
    {
        fake_gl().reset();
        {
            auto backend = make_backend(fake_desc());
            if (!backend) return false;
            const std::optional<uint64_t> pip = make_pipeline(*backend);
            ngfx::Result<uint64_t> ubo = backend->create_uniform_buffer(0, "Locals");
            ngfx::TextureInfo info{};
            info.depth = true;
            ngfx::Result<uint64_t> tex = backend->create_texture(info);
            if (!pip || !ubo.ok || !tex.ok) return false;
            ngfx::Result<uint64_t> rt = backend->create_render_texture(tex.value, info);
            if (!rt.ok) return false;

            const std::vector<ngfx::ResourceId> ids{
                ngfx::ResourceId::pipeline(*pip),
                ngfx::ResourceId::buffer(ubo.value),
                ngfx::ResourceId::render_texture(rt.value),
                ngfx::ResourceId::texture(tex.value)};
            backend->clean(ids);
            backend->clean(ids);
            if (!fake_gl().programs.empty() || !fake_gl().vertex_arrays.empty()) return false;
            if (!fake_gl().buffers.empty() || !fake_gl().textures.empty() || !fake_gl().framebuffers.empty()) return false;
            if (fake_gl().count("glDeleteBuffers") != 1 || fake_gl().count("glDeleteProgram") != 1) return false;
            if (backend->contains(ngfx::ResourceId::pipeline(*pip))) return false;

            // Цэвэрлэгдээгүй объектуудыг backend устгахдаа чөлөөлнө.
            if (!make_pipeline(*backend)) return false;
            if (!backend->create_index_buffer().ok) return false;
            ngfx::Result<uint64_t> tex2 = backend->create_texture(info);
            if (!tex2.ok || !backend->create_render_texture(tex2.value, info).ok) return false;
        }
        return fake_gl().programs.empty() && fake_gl().vertex_arrays.empty() && fake_gl().buffers.empty()
            && fake_gl().textures.empty() && fake_gl().framebuffers.empty();
    }

    bool test_error_polling_drains_queue()
    {
        fake_gl().reset();
        ngfx::GlesBackendDesc desc = fake_desc();
        desc.check_errors = true;
        auto backend = make_backend(desc);
        if (!backend) return false;

        fake_gl().pending_errors = {GL_INVALID_ENUM, GL_INVALID_OPERATION};
        backend->render(std::vector<ngfx::Command>{ngfx::CmdBegin{}, ngfx::CmdEnd{}}, std::nullopt);
        // Begin: 2 алдаа + NO_ERROR, End: NO_ERROR.
        return fake_gl().pending_errors.empty() && fake_gl().count("glGetError") == 4;
    }

    bool test_pipeline_keeps_creation_options()
    {
        fake_gl().reset();
        auto backend = make_backend(fake_desc());
        if (!backend) return false;

        ngfx::PipelineOptions options{};
        options.color_blend = ngfx::BlendMode::NORMAL;
        options.cull_mode = ngfx::CullMode::Back;
        options.primitive = ngfx::DrawPrimitive::Lines;
        const std::vector<ngfx::VertexAttr> attrs = position_attrs();
        ngfx::Result<uint64_t> id = backend->create_pipeline(bytes_of(kVs), bytes_of(kFs), attrs, options);
        if (!id.ok) return false;

        const ngfx::gles::GlesPipeline* stored = backend->pipeline(id.value);
        if (!stored || !(stored->options == options)) return false;
        if (stored->stride != 12) return false;
        return backend->pipeline(id.value + 1) == nullptr;
    }

    bool test_device_replays_identical_gl_stream()
    {
        fake_gl().reset();
        ngfx::Result<std::unique_ptr<ngfx::GlesDeviceBackend>> created = ngfx::GlesDeviceBackend::create(fake_desc(640, 480, 1.0));
        if (!created.ok) return false;
        ngfx::Device device(std::move(created.value));
        if (device.backend_type() != ngfx::DeviceBackendType::OpenGLES) return false;

        ngfx::VertexInfo vinfo{};
        vinfo.attr(0, ngfx::VertexFormat::Float32x3);
        const std::vector<float> tri{0.0f, 0.5f, 0.0f, -0.5f, -0.5f, 0.0f, 0.5f, -0.5f, 0.0f};

        ngfx::CommandEncoder enc = device.create_command_encoder();
        {
            ngfx::Result<ngfx::Pipeline> pip = device.create_pipeline().from(kVs, kFs).with_vertex_info(vinfo).build();
            ngfx::Result<ngfx::Buffer> vbo = device.create_vertex_buffer().with_info(vinfo).with_data(tri).build();
            if (!pip.ok || !vbo.ok) return false;
            if (fake_gl().count("glBufferData", {GL_ARRAY_BUFFER, 36, GL_DYNAMIC_DRAW}) != 1) return false;

            enc.begin(ngfx::ClearOptions::with_color(ngfx::Color::BLACK));
            enc.set_pipeline(pip.value);
            enc.bind_buffer(vbo.value);
            enc.draw(0, 3);
            enc.end();

            const size_t first = fake_gl().calls.size();
            device.render(enc);
            const size_t second = fake_gl().calls.size();
            device.render(enc);
            const size_t third = fake_gl().calls.size();

            // Attribute pointer-ууд VAO-д кэшлэгдсэн тул дахин тавигдахгүй, бусад дараалал ижил.
            std::vector<std::string> first_pass{};
            size_t attribute_setup = 0;
            for (size_t i = first; i < second; ++i)
            {
                const std::string& name = fake_gl().calls[i].name;
                if (is_attribute_setup(name))
                {
                    ++attribute_setup;
                    continue;
                }
                first_pass.push_back(name);
            }
            std::vector<std::string> second_pass{};
            for (size_t i = second; i < third; ++i) second_pass.push_back(fake_gl().calls[i].name);
            if (first_pass != second_pass) return false;
            if (attribute_setup == 0 || fake_gl().count("glVertexAttribPointer") != 1) return false;
            if (std::count(second_pass.begin(), second_pass.end(), "glDrawArrays") != 1) return false;
            if (fake_gl().count("glDrawArrays", {GL_TRIANGLES, 0, 3}) != 2) return false;
        }

        // Handle-ууд унасан тул clean нь GL объектуудыг устгана.
        device.clean();
        return fake_gl().programs.empty() && fake_gl().buffers.empty();
    }
}

int main()
{
    ngfx::set_log_level(ngfx::LogLevel::Error);

    const bool ok_missing = test_missing_entry_points_reported();
    const bool ok_limits = test_limits_queried_from_driver();
    const bool ok_scissor = test_scissor_and_viewport_follow_frame();
    const bool ok_stencil = test_noop_stencil_disables_test();
    const bool ok_blend = test_blend_call_selection();
    const bool ok_depth = test_depth_attachment_uses_nearest();
    const bool ok_r8 = test_r8_texture_unpack_alignment();
    const bool ok_rt_fail = test_render_target_failure_releases_objects();
    const bool ok_read = test_read_pixels_framebuffer_lifecycle();
    const bool ok_shader = test_shader_errors_carry_source();
    const bool ok_tex_bind = test_texture_binding_uses_uniform_locations();
    const bool ok_attrs = test_vertex_attributes_cached_per_source();
    const bool ok_ubo = test_uniform_block_bound_once_per_program();
    const bool ok_draw = test_draw_call_selection();
    const bool ok_pass = test_begin_clear_and_end_reset();
    const bool ok_upload = test_buffer_upload_reuses_storage();
    const bool ok_clean = test_clean_and_teardown_release_objects();
    const bool ok_errors = test_error_polling_drains_queue();
    const bool ok_pip_options = test_pipeline_keeps_creation_options();
    const bool ok_device = test_device_replays_identical_gl_stream();

    if (!ok_missing) std::fprintf(stderr, "[ngfx-tests] missing entry point report failed\n");
    if (!ok_limits) std::fprintf(stderr, "[ngfx-tests] driver limits query failed\n");
    if (!ok_scissor) std::fprintf(stderr, "[ngfx-tests] scissor/viewport frame state failed\n");
    if (!ok_stencil) std::fprintf(stderr, "[ngfx-tests] no-op stencil disable failed\n");
    if (!ok_blend) std::fprintf(stderr, "[ngfx-tests] blend call selection failed\n");
    if (!ok_depth) std::fprintf(stderr, "[ngfx-tests] depth attachment setup failed\n");
    if (!ok_r8) std::fprintf(stderr, "[ngfx-tests] R8 unpack alignment failed\n");
    if (!ok_rt_fail) std::fprintf(stderr, "[ngfx-tests] render target failure cleanup failed\n");
    if (!ok_read) std::fprintf(stderr, "[ngfx-tests] read_pixels framebuffer lifecycle failed\n");
    if (!ok_shader) std::fprintf(stderr, "[ngfx-tests] shader error text failed\n");
    if (!ok_tex_bind) std::fprintf(stderr, "[ngfx-tests] texture binding locations failed\n");
    if (!ok_attrs) std::fprintf(stderr, "[ngfx-tests] vertex attribute cache failed\n");
    if (!ok_ubo) std::fprintf(stderr, "[ngfx-tests] uniform block binding failed\n");
    if (!ok_draw) std::fprintf(stderr, "[ngfx-tests] draw call selection failed\n");
    if (!ok_pass) std::fprintf(stderr, "[ngfx-tests] begin clear / end reset failed\n");
    if (!ok_upload) std::fprintf(stderr, "[ngfx-tests] buffer upload path failed\n");
    if (!ok_clean) std::fprintf(stderr, "[ngfx-tests] clean/teardown release failed\n");
    if (!ok_errors) std::fprintf(stderr, "[ngfx-tests] GL error polling failed\n");
    if (!ok_pip_options) std::fprintf(stderr, "[ngfx-tests] pipeline creation options failed\n");
    if (!ok_device) std::fprintf(stderr, "[ngfx-tests] device replay over GLES failed\n");

    if (!(ok_missing && ok_limits && ok_scissor && ok_stencil && ok_blend && ok_depth && ok_r8 && ok_rt_fail && ok_read
        && ok_shader && ok_tex_bind && ok_attrs && ok_ubo && ok_draw && ok_pass && ok_upload && ok_clean && ok_errors
        && ok_pip_options && ok_device)) return 1;
    std::fprintf(stderr, "[ngfx-tests] all gles backend tests passed\n");
    return 0;
}
