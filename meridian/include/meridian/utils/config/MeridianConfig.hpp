#ifndef MERIDIAN_CONFIG_HPP
#define MERIDIAN_CONFIG_HPP

#include <cstdint>
#include <map>
#include <string>

// ------------------------------------------------
// [logging]
// ------------------------------------------------
struct LoggingConfig {
    ///  日志级别，如 "trace", "debug", "info", "warn", "error"
    std::string level = "info";
    /// 日志输出位置，如 "console", "file", "all"，其他值关闭日志
    std::string output_type = "console";
    /// 日志文件路径
    std::string file_path = "logs/meridian.log";
    /// 日志轮转配置 : 单个日志文件的最大大小（MB）
    uint16_t max_size_mb = 5;
    /// 日志轮转配置 : 日志文件轮转数量
    uint16_t max_files = 10;
};

// ------------------------------------------------
// [app]
// ------------------------------------------------
struct AppConfig {
    /// 应用名称
    std::string name = "Meridian";
    /// 生成绝对 URL 时使用的协议 + 主机，例如 "https://example.com"
    std::string url = "http://localhost";
    /// 应用挂载的基础路径
    std::string base_path = "/";
};

// ------------------------------------------------
// [router]
// ------------------------------------------------
struct RouterConfig {
    /// 是否启用匹配缓存。默认 true
    bool match_cache_enabled = true;
    /// 匹配缓存容量（FIFO 淘汰）。默认 1000，必须大于 0
    uint32_t match_cache_capacity = 1000;
    /// 是否允许 POST 通过 _method / X-HTTP-Method-Override 覆盖方法。默认 true
    bool method_override = true;
    /// 持久化路由缓存文件路径，为空表示不使用
    std::string route_cache_file;
};

// ------------------------------------------------
// [middleware]
// ------------------------------------------------
struct MiddlewareConfig {
    /// 别名 -> 容器中的中间件类型名
    std::map<std::string, std::string, std::less<>> aliases;
};

struct MeridianConfig {
    AppConfig app;
    RouterConfig router;
    MiddlewareConfig middleware;
    LoggingConfig logging;
};

#endif //MERIDIAN_CONFIG_HPP
