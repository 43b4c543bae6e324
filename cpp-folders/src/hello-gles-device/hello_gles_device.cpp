#define SDL_MAIN_HANDLED

#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <SDL2/SDL.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <ngfx/core/config.hpp>
#include <ngfx/core/log.hpp>
#include <ngfx/gfx/device.hpp>
#include <ngfx/platform/sdl/sdl_gl_runtime.hpp>
#include <ngfx/rhi/backend/backend_factory.hpp>

/*
    Instanced triangle-ууд offscreen render texture руу (depth-тэй) зурагдаж,
    дараа нь дэлгэцэн дээр textured quad болон харагдана.

    S   : scissor асаах/унтраах
    B   : quad-ийн blend mode солих
    O   : offscreen pass-ийг алгасах
    F12 : render texture-ийн төв pixel-ийг уншиж хэвлэх
*/

namespace
{
constexpr int kDefaultW = 960;
constexpr int kDefaultH = 640;
constexpr int kOffscreenW = 512;
constexpr int kOffscreenH = 512;
constexpr int kInstanceGrid = 6;

const char* kSceneVs = R"(#version 300 es
layout(location = 0) in vec3 a_pos;
layout(location = 1) in vec4 a_color;
layout(location = 2) in vec2 a_offset;
layout(std140) uniform Locals {
    mat4 u_mvp;
};
out vec4 v_color;
void main() {
    v_color = a_color;
    gl_Position = u_mvp * vec4(a_pos.xy + a_offset, a_pos.z, 1.0);
}
)";

const char* kSceneFs = R"(#version 300 es
precision mediump float;
in vec4 v_color;
out vec4 o_color;
void main() {
    o_color = v_color;
}
)";

const char* kQuadVs = R"(#version 300 es
layout(location = 0) in vec2 a_pos;
layout(location = 1) in vec2 a_uv;
out vec2 v_uv;
void main() {
    v_uv = a_uv;
    gl_Position = vec4(a_pos, 0.0, 1.0);
}
)";

const char* kQuadFs = R"(#version 300 es
precision mediump float;
uniform sampler2D u_texture;
in vec2 v_uv;
out vec4 o_color;
void main() {
    o_color = texture(u_texture, v_uv);
}
)";

template<typename T>
T expect(ngfx::Result<T> r, const char* what)
{
    if (!r.ok) throw std::runtime_error(std::string(what) + ": " + r.error);
    return std::move(r.value);
}

std::vector<uint8_t> make_checker(int w, int h, int cell)
{
    std::vector<uint8_t> px((size_t)w * (size_t)h * 4u);
    for (int y = 0; y < h; ++y)
    {
        for (int x = 0; x < w; ++x)
        {
            const bool on = ((x / cell) + (y / cell)) % 2 == 0;
            const size_t i = ((size_t)y * (size_t)w + (size_t)x) * 4u;
            px[i + 0] = on ? 230 : 40;
            px[i + 1] = on ? 200 : 40;
            px[i + 2] = on ? 90 : 60;
            px[i + 3] = 255;
        }
    }
    return px;
}

class HelloGlesDeviceApp
{
public:
    explicit HelloGlesDeviceApp(std::string image_path)
        : image_path_(std::move(image_path))
    {}

    ~HelloGlesDeviceApp()
    {
        cleanup();
    }

    void run()
    {
        init_platform();
        init_device();
        create_scene();
        create_quad();
        main_loop();
    }

private:
    void init_platform()
    {
        ngfx::WindowDesc win{};
        win.title = "HelloGlesDevice";
        win.width = kDefaultW;
        win.height = kDefaultH;
        runtime_ = std::make_unique<ngfx::SdlGlRuntime>(win);
        if (!runtime_->valid()) throw std::runtime_error(runtime_->error());
    }

    void init_device()
    {
        ngfx::apply_env_log_level();

        int w = 0;
        int h = 0;
        runtime_->window_size(w, h);

        ngfx::DeviceConfig cfg{};
        cfg.width = w > 0 ? w : kDefaultW;
        cfg.height = h > 0 ? h : kDefaultH;
        cfg.dpi = runtime_->dpi_scale();
        cfg = ngfx::apply_env_overrides(cfg);

        ngfx::GlesBackendDesc desc{};
        desc.loader = runtime_->gl_loader();
        desc.width = cfg.width;
        desc.height = cfg.height;
        desc.dpi = cfg.dpi;
        desc = ngfx::apply_env_overrides(desc);

        const ngfx::DeviceBackendType type = ngfx::backend_type_from_env(ngfx::DeviceBackendType::OpenGLES);
        std::unique_ptr<ngfx::IDeviceBackend> backend = expect(ngfx::create_device_backend(type, desc), "create_device_backend");
        device_ = std::make_unique<ngfx::Device>(std::move(backend), cfg);
        std::fprintf(stderr, "[ngfx] active backend: %s, dpi %.2f\n", device_->backend_name(), device_->dpi());
    }

    void create_scene()
    {
        ngfx::VertexInfo vertex_info{};
        vertex_info.attr(0, ngfx::VertexFormat::Float32x3).attr(1, ngfx::VertexFormat::Float32x4);
        ngfx::VertexInfo instance_info{};
        instance_info.attr(2, ngfx::VertexFormat::Float32x2).step(ngfx::VertexStepMode::Instance);

        // Pipeline-ийн layout нь vertex + instance attribute-уудыг хоёуланг нь багтаана.
        ngfx::VertexInfo pipeline_info = vertex_info;
        pipeline_info.attrs.insert(pipeline_info.attrs.end(), instance_info.attrs.begin(), instance_info.attrs.end());

        scene_pipeline_ = expect(
            device_->create_pipeline()
                .from(kSceneVs, kSceneFs)
                .with_vertex_info(pipeline_info)
                .with_depth_stencil(ngfx::DepthStencil{true, ngfx::CompareMode::Less})
                .with_cull_mode(ngfx::CullMode::None)
                .build(),
            "scene pipeline");

        const float vertices[] = {
            -0.3f, -0.3f, 0.0f,   1.0f, 0.2f, 0.2f, 1.0f,
             0.3f, -0.3f, 0.0f,   0.2f, 1.0f, 0.2f, 1.0f,
             0.0f,  0.3f, 0.0f,   0.2f, 0.2f, 1.0f, 1.0f,
        };
        scene_vbo_ = expect(device_->create_vertex_buffer().with_info(vertex_info).with_data(vertices).build(), "scene vbo");

        std::vector<float> offsets{};
        for (int y = 0; y < kInstanceGrid; ++y)
        {
            for (int x = 0; x < kInstanceGrid; ++x)
            {
                offsets.push_back(((float)x - (float)(kInstanceGrid - 1) * 0.5f) * 0.8f);
                offsets.push_back(((float)y - (float)(kInstanceGrid - 1) * 0.5f) * 0.8f);
            }
        }
        instance_vbo_ = expect(device_->create_vertex_buffer().with_info(instance_info).with_data(offsets).build(), "instance vbo");

        const uint32_t indices[] = {0, 1, 2};
        scene_ibo_ = expect(device_->create_index_buffer().with_data(indices).build(), "scene ibo");

        const glm::mat4 identity(1.0f);
        locals_ubo_ = expect(
            device_->create_uniform_buffer(0, "Locals")
                .with_data(std::span<const float>(glm::value_ptr(identity), 16))
                .build(),
            "locals ubo");

        offscreen_ = expect(
            device_->create_render_texture(kOffscreenW, kOffscreenH).with_depth().build(),
            "offscreen render texture");
    }

    void create_quad()
    {
        ngfx::VertexInfo info{};
        info.attr(0, ngfx::VertexFormat::Float32x2).attr(1, ngfx::VertexFormat::Float32x2);

        quad_pipeline_ = expect(
            device_->create_pipeline()
                .from(kQuadVs, kQuadFs)
                .with_vertex_info(info)
                .with_color_blend(ngfx::BlendMode::NORMAL)
                .with_primitive(ngfx::DrawPrimitive::TriangleStrip)
                .build(),
            "quad pipeline");

        const float quad[] = {
            -0.9f, -0.9f, 0.0f, 0.0f,
             0.9f, -0.9f, 1.0f, 0.0f,
            -0.9f,  0.9f, 0.0f, 1.0f,
             0.9f,  0.9f, 1.0f, 1.0f,
        };
        quad_vbo_ = expect(device_->create_vertex_buffer().with_info(info).with_data(quad).build(), "quad vbo");

        // Дэвсгэр texture: файл өгөгдвөл SDL2_image-аар, үгүй бол checker.
        if (!image_path_.empty())
        {
            ngfx::Result<ngfx::Rgba8Image> img = ngfx::load_rgba8_image(image_path_);
            if (img.ok)
            {
                background_ = expect(
                    device_->create_texture().from_bytes(img.value.pixels, img.value.width, img.value.height).build(),
                    "background texture");
                return;
            }
            ngfx::log_warn("[hello] " + img.error + ", using checker background");
        }

        const std::vector<uint8_t> checker = make_checker(256, 256, 32);
        background_ = expect(device_->create_texture().from_bytes(checker, 256, 256).build(), "background texture");

        // Төв хэсгийг sub-rect update-ээр будна.
        const std::vector<uint8_t> patch((size_t)64 * 64 * 4, 255);
        const ngfx::Status st = device_->update_texture(background_).x_offset(96).y_offset(96).with_size(64, 64).with_data(patch).update();
        if (!st.ok) ngfx::log_warn("[hello] background patch failed: " + st.error);
    }

    void main_loop()
    {
        bool running = true;
        uint64_t frame_index = 0;
        const uint64_t start_ticks = SDL_GetTicks64();
        while (running)
        {
            ngfx::PlatformInputState input{};
            running = runtime_->pump_input(input);
            if (input.resized)
            {
                int w = 0;
                int h = 0;
                runtime_->window_size(w, h);
                if (w > 0 && h > 0) device_->set_size(w, h);
                device_->set_dpi(runtime_->dpi_scale());
            }
            if (input.toggle_scissor) use_scissor_ = !use_scissor_;
            if (input.toggle_offscreen) draw_offscreen_ = !draw_offscreen_;
            if (input.cycle_blend) blend_index_ = (blend_index_ + 1) % kBlendModes.size();

            const float t = (float)(SDL_GetTicks64() - start_ticks) * 0.001f;
            if (draw_offscreen_) render_offscreen(t);
            render_screen();
            if (input.capture_frame) capture_center_pixel();

            device_->clean();
            runtime_->swap_buffers();

            if ((frame_index++ % 120u) == 0u)
            {
                runtime_->set_title("HelloGlesDevice | blend " + std::to_string(blend_index_)
                    + (use_scissor_ ? " | scissor" : "") + (draw_offscreen_ ? "" : " | offscreen off"));
            }
        }
    }

    void render_offscreen(float t)
    {
        const float aspect = (float)kOffscreenW / (float)kOffscreenH;
        const glm::mat4 proj = glm::perspective(glm::radians(60.0f), aspect, 0.1f, 100.0f);
        const glm::mat4 view = glm::lookAt(glm::vec3(0.0f, 0.0f, 6.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
        const glm::mat4 model = glm::rotate(glm::mat4(1.0f), t, glm::vec3(0.0f, 0.0f, 1.0f));
        const glm::mat4 mvp = proj * view * model;
        device_->set_buffer_data(locals_ubo_, std::span<const float>(glm::value_ptr(mvp), 16));

        ngfx::CommandEncoder enc(kOffscreenW, kOffscreenH);
        ngfx::ClearOptions clear{};
        clear.color = ngfx::Color::rgba(0.08f, 0.09f, 0.14f, 1.0f);
        clear.depth = 1.0f;
        enc.begin(clear);
        enc.set_pipeline(scene_pipeline_);
        const ngfx::Buffer* buffers[] = {&scene_vbo_, &instance_vbo_, &scene_ibo_, &locals_ubo_};
        enc.bind_buffers(buffers);
        enc.draw_instanced(0, 3, kInstanceGrid * kInstanceGrid);
        enc.end();
        device_->render_to(offscreen_, enc);
    }

    void render_screen()
    {
        ngfx::CommandEncoder enc = device_->create_command_encoder();
        enc.begin(ngfx::ClearOptions::with_color(ngfx::Color::from_hex(0x1a1a24ff)));

        ngfx::PipelineOptions opts = quad_pipeline_.options();
        opts.color_blend = kBlendModes[blend_index_];

        if (use_scissor_)
        {
            enc.set_scissors((float)device_->width() * 0.25f, (float)device_->height() * 0.25f,
                (float)device_->width() * 0.5f, (float)device_->height() * 0.5f);
        }

        enc.set_pipeline(quad_pipeline_);
        enc.bind_buffer(quad_vbo_);
        enc.bind_texture(background_, 0, 0);
        enc.draw(0, 4);
        if (draw_offscreen_)
        {
            enc.bind_texture(offscreen_.texture(), 0, 0);
            enc.draw(0, 4);
        }
        enc.end();

        // Blend mode нь pipeline handle-ээс биш command-оос уншигдана.
        ngfx::CommandList cmds = enc.take_commands();
        for (ngfx::Command& cmd : cmds)
        {
            if (auto* sp = std::get_if<ngfx::CmdSetPipeline>(&cmd)) sp->options = opts;
        }
        device_->render(cmds);
    }

    void capture_center_pixel()
    {
        std::array<uint8_t, 4> px{};
        const ngfx::Status st = device_->read_pixels(offscreen_.texture())
            .x_offset(kOffscreenW / 2)
            .y_offset(kOffscreenH / 2)
            .with_size(1, 1)
            .read_to(px);
        if (!st.ok)
        {
            ngfx::log_warn("[hello] read_pixels failed: " + st.error);
            return;
        }
        std::fprintf(stderr, "[hello] offscreen center pixel: %u %u %u %u\n", px[0], px[1], px[2], px[3]);
    }

    void cleanup()
    {
        if (cleaned_up_) return;
        cleaned_up_ = true;

        // Handle-ууд device-ээс өмнө устаж, device-ийн destructor тэднийг цэвэрлэнэ.
        scene_pipeline_ = {};
        quad_pipeline_ = {};
        scene_vbo_ = {};
        instance_vbo_ = {};
        scene_ibo_ = {};
        locals_ubo_ = {};
        quad_vbo_ = {};
        background_ = {};
        offscreen_ = {};
        device_.reset();
        runtime_.reset();
    }

private:
    static constexpr std::array<ngfx::BlendMode, 4> kBlendModes = {
        ngfx::BlendMode::NORMAL,
        ngfx::BlendMode::ADD,
        ngfx::BlendMode::MULTIPLY,
        ngfx::BlendMode::SCREEN,
    };

    std::string image_path_{};
    bool cleaned_up_ = false;
    bool use_scissor_ = false;
    bool draw_offscreen_ = true;
    size_t blend_index_ = 0;

    std::unique_ptr<ngfx::SdlGlRuntime> runtime_{};
    std::unique_ptr<ngfx::Device> device_{};

    ngfx::Pipeline scene_pipeline_{};
    ngfx::Pipeline quad_pipeline_{};
    ngfx::Buffer scene_vbo_{};
    ngfx::Buffer instance_vbo_{};
    ngfx::Buffer scene_ibo_{};
    ngfx::Buffer locals_ubo_{};
    ngfx::Buffer quad_vbo_{};
    ngfx::Texture background_{};
    ngfx::RenderTexture offscreen_{};
};
}

int main(int argc, char** argv)
{
    try
    {
        HelloGlesDeviceApp app(argc > 1 ? argv[1] : "");
        app.run();
        return 0;
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
}
