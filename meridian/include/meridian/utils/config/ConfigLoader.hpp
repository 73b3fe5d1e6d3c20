#ifndef MERIDIAN_CONFIG_LOADER_HPP
#define MERIDIAN_CONFIG_LOADER_HPP

#include <string>

#include <toml++/toml.hpp>

#include <meridian/utils/config/MeridianConfig.hpp>


class ConfigLoader {
public:
    /**
     * @brief 从指定的 TOML 文件路径加载配置。
     *
     * 根表中存在 active_profile (dev | prod | test) 时，改为加载同目录下的
     * `<stem>-<profile>.toml`。
     *
     * @throws std::runtime_error 文件不存在、解析失败或校验失败。
     */
    static MeridianConfig load(const std::string& filepath);

    /// 从 TOML 文本解析（测试与内嵌配置使用），不支持 active_profile 跳转
    static MeridianConfig parse(std::string_view content);

private:
    static MeridianConfig from_table(const toml::table& root);

    static AppConfig parse_app(const toml::table& root);
    static RouterConfig parse_router(const toml::table& root);
    static MiddlewareConfig parse_middleware(const toml::table& root);
    static LoggingConfig parse_logging(const toml::table& root);
};

/// 加载后的统一校验，失败抛出 std::runtime_error
void finalize_config(MeridianConfig& config);

#endif //MERIDIAN_CONFIG_LOADER_HPP
