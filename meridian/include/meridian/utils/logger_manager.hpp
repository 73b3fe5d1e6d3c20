#ifndef MERIDIAN_LOGGER_MANAGER_HPP
#define MERIDIAN_LOGGER_MANAGER_HPP

#include <chrono>
#include <cstdio>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <meridian/utils/config/MeridianConfig.hpp>

namespace meridian {

    /**
     * @class LoggerManager
     * @brief 按 [logging] 配置初始化全局异步 logger。
     *
     * output_type:
     * - "console" 彩色控制台
     * - "file"    轮转文件
     * - "all"     两者都有
     * - 其他值    null sink，并关闭日志
     */
    class LoggerManager {
    public:
        static void init(const LoggingConfig& config) {
            try {
                // 重复初始化（例如测试里多次构造 App）时先释放旧的 logger 与线程池
                spdlog::shutdown();
                spdlog::init_thread_pool(8192, 1);

                std::vector<spdlog::sink_ptr> sinks;

                if (config.output_type == "console" || config.output_type == "all") {
                    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
                }

                if (config.output_type == "file" || config.output_type == "all") {
                    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        config.file_path, static_cast<size_t>(config.max_size_mb) * 1024 * 1024, config.max_files));
                }

                const bool silent = sinks.empty();
                if (silent) {
                    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                }

                const auto logger = std::make_shared<spdlog::async_logger>(
                    "meridian", sinks.begin(), sinks.end(),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::overrun_oldest);

                const spdlog::level::level_enum level = silent ? spdlog::level::off : spdlog::level::from_str(config.level);
                logger->set_level(level);

                spdlog::set_default_logger(logger);
                spdlog::set_level(level);

                // 异步日志：定时刷盘，错误立即刷盘
                using namespace std::chrono_literals;
                spdlog::flush_every(10s);
                spdlog::flush_on(spdlog::level::err);

                spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e %z] [thread %t] [%s:%#] [%^%l%$] %v");

                SPDLOG_INFO("Logger level : {}", spdlog::level::to_string_view(spdlog::default_logger()->level()));
            } catch (const spdlog::spdlog_ex& ex) {
                std::fprintf(stderr, "Log init failed: %s\n", ex.what());
            }
        }

        static void shutdown() {
            spdlog::shutdown();
        }

        LoggerManager() = delete;
    };

} // namespace meridian

#endif //MERIDIAN_LOGGER_MANAGER_HPP
