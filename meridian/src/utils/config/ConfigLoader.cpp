#include <meridian/utils/config/ConfigLoader.hpp>

#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>


void finalize_config(MeridianConfig& config) {
    if (config.router.match_cache_capacity == 0) {
        throw std::runtime_error("router.match_cache_capacity must be greater than 0");
    }

    const std::string& url = config.app.url;
    if (!url.starts_with("http://") && !url.starts_with("https://")) {
        throw std::runtime_error("app.url '" + url + "' must start with http:// or https://");
    }
    // 去掉末尾的 '/'，生成绝对 URL 时直接拼接路径
    while (config.app.url.ends_with('/')) {
        config.app.url.pop_back();
    }

    if (config.app.base_path.empty() || config.app.base_path.front() != '/') {
        config.app.base_path.insert(config.app.base_path.begin(), '/');
    }

    for (const auto& [alias, target] : config.middleware.aliases) {
        if (target.empty()) {
            throw std::runtime_error("middleware alias '" + alias + "' has an empty target");
        }
    }
}

// --- 主加载函数 ---
MeridianConfig ConfigLoader::load(const std::string& filepath) {
    try {
        toml::table root_tbl = toml::parse_file(filepath);

        if (const auto profile = root_tbl["active_profile"].value<std::string>()) {
            if (*profile != "dev" && *profile != "prod" && *profile != "test") {
                throw std::runtime_error("无法识别的配置文件类型[ " + *profile + " ]");
            }
            const std::filesystem::path path = filepath;
            const std::filesystem::path profile_path =
                path.parent_path() / (path.stem().string() + "-" + *profile + path.extension().string());
            root_tbl = toml::parse_file(profile_path.string());
        }

        return from_table(root_tbl);
    } catch (const toml::parse_error& err) {
        SPDLOG_ERROR("Error parsing config file '{}': {}", filepath, err.description());
        throw std::runtime_error("Error parsing config file '" + filepath + "': " + std::string(err.description()));
    }
}

MeridianConfig ConfigLoader::parse(const std::string_view content) {
    try {
        return from_table(toml::parse(content));
    } catch (const toml::parse_error& err) {
        throw std::runtime_error("Error parsing config: " + std::string(err.description()));
    }
}

MeridianConfig ConfigLoader::from_table(const toml::table& root) {
    MeridianConfig config;
    config.app = parse_app(root);
    config.router = parse_router(root);
    config.middleware = parse_middleware(root);
    config.logging = parse_logging(root);

    finalize_config(config);
    return config;
}

// --- 私有帮助函数实现 ---

AppConfig ConfigLoader::parse_app(const toml::table& root) {
    AppConfig appConfig;
    if (const auto table = root["app"].as_table()) {
        appConfig.name = (*table)["name"].value_or(appConfig.name);
        appConfig.url = (*table)["url"].value_or(appConfig.url);
        appConfig.base_path = (*table)["base_path"].value_or(appConfig.base_path);
    }
    return appConfig;
}

RouterConfig ConfigLoader::parse_router(const toml::table& root) {
    RouterConfig routerConfig;
    if (const auto table = root["router"].as_table()) {
        routerConfig.match_cache_enabled = (*table)["match_cache_enabled"].value_or(routerConfig.match_cache_enabled);
        routerConfig.match_cache_capacity = (*table)["match_cache_capacity"].value_or(routerConfig.match_cache_capacity);
        routerConfig.method_override = (*table)["method_override"].value_or(routerConfig.method_override);
        routerConfig.route_cache_file = (*table)["route_cache_file"].value_or(routerConfig.route_cache_file);
    }
    return routerConfig;
}

MiddlewareConfig ConfigLoader::parse_middleware(const toml::table& root) {
    MiddlewareConfig middlewareConfig;
    if (const auto aliases = root["middleware"]["aliases"].as_table()) {
        for (const auto& [key, node] : *aliases) {
            if (const auto target = node.value<std::string>()) {
                middlewareConfig.aliases[std::string(key.str())] = *target;
            } else {
                SPDLOG_WARN("middleware alias '{}' is not a string, ignored", key.str());
            }
        }
    }
    return middlewareConfig;
}

LoggingConfig ConfigLoader::parse_logging(const toml::table& root) {
    LoggingConfig logConfig;
    if (const auto table = root["logging"].as_table()) {
        logConfig.level = (*table)["level"].value_or(logConfig.level);
        logConfig.output_type = (*table)["output_type"].value_or(logConfig.output_type);
        logConfig.file_path = (*table)["file_path"].value_or(logConfig.file_path);
        logConfig.max_size_mb = (*table)["max_size_mb"].value_or(logConfig.max_size_mb);
        logConfig.max_files = (*table)["max_files"].value_or(logConfig.max_files);
    }
    return logConfig;
}
