#pragma once

/*
    NGFX RENDERER SAN

    FILE: config.hpp
    MODULE: core
    PURPOSE: Environment overrides for device/backend descriptors (NGFX_* variables).
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#include "ngfx/core/log.hpp"

namespace ngfx
{
    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    inline double parse_env_f64(const char* value, double fallback, double min_value = 0.0)
    {
        if (!value || *value == '\0') return fallback;
        char* end = nullptr;
        const double parsed = std::strtod(value, &end);
        if (end == value || !std::isfinite(parsed)) return fallback;
        return std::max(min_value, parsed);
    }

    struct DeviceConfig
    {
        int width = 1;
        int height = 1;
        double dpi = 1.0;
    };

    // NGFX_DPI дээр 0-ээс их утга байвал dpi-г дарна.
    inline DeviceConfig apply_env_overrides(DeviceConfig cfg)
    {
        const double dpi = parse_env_f64(std::getenv("NGFX_DPI"), 0.0, 0.0);
        if (dpi > 0.0) cfg.dpi = dpi;
        return cfg;
    }

    inline void apply_env_log_level()
    {
        if (const char* level = std::getenv("NGFX_LOG_LEVEL"))
        {
            if (*level != '\0') set_log_level(parse_log_level(level, log_level()));
        }
    }
}
