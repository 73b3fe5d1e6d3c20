#include <meridian/App.hpp>
#include <meridian/routing/route_cache.hpp>
#include <meridian/utils/config/ConfigLoader.hpp>
#include <meridian/utils/logger_manager.hpp>
#include <meridian/version.hpp>

#include <filesystem>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace meridian {

    App::App(const std::string& config_path)
        : App(ConfigLoader::load(config_path)) {
    }

    App::App(MeridianConfig config)
        : config_(std::move(config)),
          router_(config_.router),
          kernel_(router_, container_, config_.router, config_.middleware),
          url_(router_, config_.app) {
        LoggerManager::init(config_.logging);
        SPDLOG_INFO("{} {} ({})", framework::name, framework::version, config_.app.name);
        SPDLOG_INFO("📁 Workdir: {}", std::filesystem::current_path().string());
    }

    App::~App() = default;

    void App::boot(const std::function<void(Router&)>& routes) {
        if (booted_) {
            SPDLOG_WARN("App::boot called twice, ignored");
            return;
        }

        const std::string& cache_file = config_.router.route_cache_file;
        if (!cache_file.empty() && std::filesystem::exists(cache_file)) {
            RouteCache::load(router_, cache_file);
        } else {
            for (const auto& controller : controllers_) {
                controller->registerRoutes(router_);
            }
            if (routes) {
                routes(router_);
            }
        }

        booted_ = true;
        log_routes();
    }

    void App::cacheRoutes() const {
        if (config_.router.route_cache_file.empty()) {
            SPDLOG_WARN("router.route_cache_file is not configured, nothing written");
            return;
        }
        RouteCache::save(router_, config_.router.route_cache_file);
    }

    HttpResponse App::handle(ServerRequest& request, std::stop_token stop) {
        return kernel_.handle(request, std::move(stop));
    }

    void App::log_routes() const {
        SPDLOG_INFO("Registered {} routes", router_.routes().size());
        for (const Route* route : router_.routes()) {
            std::vector<std::string> middleware;
            for (const auto& m : route->middleware()) middleware.push_back(describe_middleware(m));
            SPDLOG_DEBUG("  {:<7} {:<40} {:<28} {} [{}]",
                         method_name(route->method()), route->path(), route->name().value_or(""),
                         route->handler().describe(), fmt::join(middleware, ", "));
        }
    }

} // namespace meridian
