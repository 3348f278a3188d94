#pragma once

#ifndef __LOG_HPP
#define __LOG_HPP

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#define SPDLOG_HEADER_ONLY
#define FMT_UNICODE 0
#include <spdlog/spdlog.h>
#include <fmt/printf.h>
#include <fmt/ostream.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace applog {

using logger = std::shared_ptr<spdlog::logger>;

// default log id
constexpr char const* _log_id_ = "rtcgw";
// default log file
constexpr char const* _log_file_ = "rtcgw.log";

struct log {
    struct config {
        // log level, -1 keeps spdlog's default (info)
        int level{ -1 };
        // log name
        char const* id{ _log_id_ };
        // log file
        char const* file{ _log_file_ };
        // log to console
        bool std_out{ true };
        // color
        bool no_color{ false };
        // log to file
        bool file_out{ true };
        // file truncate
        bool truncate{ true };
        // flush period in sec
        unsigned int flush_every{ 1 };
    };

    using config_t = config;

    static logger& get() {
        static logger instance;
        if (instance == nullptr) {
            instance = make();
            g_instance = instance;
        }
        return instance;
    }

    static config& cfg() {
        static config conf;
        return conf;
    }

    // signaling, monitor and telemetry threads all log, sinks are always _mt
    static logger make() {
        auto& config = cfg();
        std::vector<spdlog::sink_ptr> sinks;
        if (config.std_out) {
            if (config.no_color)
                sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
            else sinks.emplace_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (config.file_out)
            sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, config.truncate));
        auto result = std::make_shared<spdlog::logger>(config.id, begin(sinks), end(sinks));
        if (config.level >= 0)
            result->set_level(static_cast<spdlog::level::level_enum>(config.level));
        spdlog::register_logger(result);
        spdlog::flush_every(std::chrono::seconds(config.flush_every));
        return result;
    }

    static void set_level(spdlog::level::level_enum level) {
        cfg().level = static_cast<int>(level);
        if (g_instance)
            g_instance->set_level(level);
    }

    static inline logger g_instance{ nullptr };
};

inline logger& log() {
    return log::get();
}

} // namespace applog

#ifdef LOG_DISABLED
#   define LOG_LEVEL_FMT_IMPL( ... )	            (void)0
#   define LOG_LEVEL_FMT( ... )			            (void)0
#   define LOG_LEVEL_PRINTF( ... )		            (void)0
#else
#   define LOG_LEVEL_FMT_IMPL( level, ... )	        if ( ::applog::log::g_instance ) SPDLOG_LOGGER##level( applog::log(), __VA_ARGS__ ); else (void)0
#   define LOG_LEVEL_FMT( level, ... )			    LOG_LEVEL_FMT_IMPL( _##level, __VA_ARGS__ )
#   define LOG_LEVEL_PRINTF( level, ... )		    LOG_LEVEL_FMT_IMPL( _##level, "{}", fmt::sprintf( __VA_ARGS__ ) )
#endif // #ifdef LOG_DISABLED

#define LOG_TRACE_PRINTF(...)				        LOG_LEVEL_PRINTF( TRACE, __VA_ARGS__ )
#define LOG_DEBUG_PRINTF(...)				        LOG_LEVEL_PRINTF( DEBUG, __VA_ARGS__ )
#define LOG_INFO_PRINTF(...)				        LOG_LEVEL_PRINTF( INFO, __VA_ARGS__ )
#define LOG_WARNING_PRINTF(...)				        LOG_LEVEL_PRINTF( WARN, __VA_ARGS__ )
#define LOG_ERROR_PRINTF(...)				        LOG_LEVEL_PRINTF( ERROR, __VA_ARGS__ )
#define LOG_CRITICAL_PRINTF(...)			        LOG_LEVEL_PRINTF( CRITICAL, __VA_ARGS__ )

#define LOG_TRACE_FMT(...)					        LOG_LEVEL_FMT( TRACE, __VA_ARGS__ )
#define LOG_DEBUG_FMT(...)					        LOG_LEVEL_FMT( DEBUG, __VA_ARGS__ )
#define LOG_INFO_FMT(...)					        LOG_LEVEL_FMT( INFO, __VA_ARGS__ )
#define LOG_WARNING_FMT(...)				        LOG_LEVEL_FMT( WARN, __VA_ARGS__ )
#define LOG_ERROR_FMT(...)					        LOG_LEVEL_FMT( ERROR, __VA_ARGS__ )
#define LOG_CRITICAL_FMT(...)				        LOG_LEVEL_FMT( CRITICAL, __VA_ARGS__ )

#define LOG_TRACE							        LOG_TRACE_PRINTF
#define LOG_DEBUG							        LOG_DEBUG_PRINTF
#define LOG_INFO							        LOG_INFO_PRINTF
#define LOG_WARNING							        LOG_WARNING_PRINTF
#define LOG_ERROR							        LOG_ERROR_PRINTF
#define LOG_CRITICAL						        LOG_CRITICAL_PRINTF

#endif // #ifndef __LOG_HPP
