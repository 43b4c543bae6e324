#pragma once

/*
    NGFX РЕНДЕРЕР САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энэ файл нь ngfx-renderer-lib-ийн core модульд хамаарах төрөл/функцийн
            интерфэйс эсвэл хэрэгжүүлэлтийг тодорхойлно.
*/


#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace ngfx
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3
    };

    namespace detail
    {
        inline std::atomic<LogLevel>& log_level_storage()
        {
            static std::atomic<LogLevel> level{LogLevel::Info};
            return level;
        }

        inline bool log_enabled(LogLevel level)
        {
            return (uint8_t)level >= (uint8_t)log_level_storage().load(std::memory_order_relaxed);
        }
    }

    inline void set_log_level(LogLevel level)
    {
        detail::log_level_storage().store(level, std::memory_order_relaxed);
    }

    inline LogLevel log_level()
    {
        return detail::log_level_storage().load(std::memory_order_relaxed);
    }

    inline const char* log_level_name(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
        }
        return "unknown";
    }

    inline LogLevel parse_log_level(std::string_view text, LogLevel fallback = LogLevel::Info)
    {
        if (text == "debug" || text == "DEBUG") return LogLevel::Debug;
        if (text == "info" || text == "INFO") return LogLevel::Info;
        if (text == "warn" || text == "WARN" || text == "warning") return LogLevel::Warn;
        if (text == "error" || text == "ERROR") return LogLevel::Error;
        return fallback;
    }

    inline void log_debug(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!detail::log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
