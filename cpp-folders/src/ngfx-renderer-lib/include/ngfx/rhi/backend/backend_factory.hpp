#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: backend_factory.hpp
    МОДУЛЬ: rhi/backend
    ЗОРИЛГО: Device backend-ийг нэр/type-ээр үүсгэх helper.
            NGFX_BACKEND орчны хувьсагчаар сонголтыг дарж болно.
*/


#include <cctype>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ngfx/core/log.hpp"
#include "ngfx/core/result.hpp"
#include "ngfx/rhi/core/backend.hpp"
#include "ngfx/rhi/drivers/gles/gles_backend.hpp"
#include "ngfx/rhi/drivers/headless/headless_backend.hpp"

namespace ngfx
{
    inline std::string to_lower_ascii(std::string_view s)
    {
        std::string out{};
        out.reserve(s.size());
        for (const char c : s)
        {
            out.push_back((char)std::tolower((unsigned char)c));
        }
        return out;
    }

    inline DeviceBackendType parse_device_backend_type(std::string_view text, DeviceBackendType fallback = DeviceBackendType::OpenGLES)
    {
        const std::string v = to_lower_ascii(text);
        if (v == "gles" || v == "gl" || v == "opengl") return DeviceBackendType::OpenGLES;
        if (v == "headless" || v == "null" || v == "none") return DeviceBackendType::Headless;
        return fallback;
    }

    inline DeviceBackendType backend_type_from_env(DeviceBackendType fallback)
    {
        const char* v = std::getenv("NGFX_BACKEND");
        if (!v || *v == '\0') return fallback;
        return parse_device_backend_type(v, fallback);
    }

    // Headless нь desc.loader-ийг ашиглахгүй.
    inline Result<std::unique_ptr<IDeviceBackend>> create_device_backend(DeviceBackendType requested, const GlesBackendDesc& desc)
    {
        using BackendResult = Result<std::unique_ptr<IDeviceBackend>>;
        switch (requested)
        {
            case DeviceBackendType::Headless:
            {
                std::unique_ptr<IDeviceBackend> backend = std::make_unique<HeadlessDeviceBackend>();
                backend->set_size(desc.width, desc.height);
                backend->set_dpi(desc.dpi);
                return BackendResult::success(std::move(backend));
            }
            case DeviceBackendType::OpenGLES:
            {
                Result<std::unique_ptr<GlesDeviceBackend>> gles = GlesDeviceBackend::create(desc);
                if (!gles.ok)
                {
                    log_error("[ngfx] OpenGL ES backend creation failed: " + gles.error);
                    return BackendResult::failure_from(gles);
                }
                return BackendResult::success(std::move(gles.value));
            }
        }
        return BackendResult::failure("Unknown device backend type.");
    }
}
