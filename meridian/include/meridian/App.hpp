#ifndef MERIDIAN_APP_HPP
#define MERIDIAN_APP_HPP

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <type_traits>
#include <vector>

#include <meridian/container/container.hpp>
#include <meridian/controller/HttpController.hpp>
#include <meridian/dispatch/kernel.hpp>
#include <meridian/routing/router.hpp>
#include <meridian/routing/url_generator.hpp>
#include <meridian/utils/config/MeridianConfig.hpp>

namespace meridian {

    /**
     * @brief 应用程序核心类
     *
     * 负责组件的装配与启动：
     * 1. 加载配置、初始化日志
     * 2. 构建容器、路由表、分发管道与 URL 生成器
     * 3. 启动时注册路由，或者从持久化路由缓存恢复
     *
     * 传输层拿到请求后调用 handle()，得到可以直接写回的响应。
     */
    class App {
    public:
        /// @brief 从 TOML 配置文件构造
        explicit App(const std::string& config_path = "config.toml");

        /// @brief 直接使用已有配置构造（测试常用）
        explicit App(MeridianConfig config);

        ~App();

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        // --- 服务注册接口 ---

        /// @brief 注册控制器：放入容器（供 "Type@method" 解析），并在 boot 时调用 registerRoutes
        template<typename T>
            requires std::is_base_of_v<HttpController, T>
        void addController(std::string type, std::shared_ptr<T> controller) {
            container_.singleton<T>(std::move(type), controller);
            controllers_.push_back(std::move(controller));
        }

        /**
         * @brief 启动：配置了 route_cache_file 且文件存在时从缓存恢复路由，
         *        否则调用各控制器的 registerRoutes 与 routes 回调。
         */
        void boot(const std::function<void(Router&)>& routes = {});

        /// @brief 把当前路由表写入 route_cache_file
        /// @throws UncacheableHandler 路由中包含内联闭包
        void cacheRoutes() const;

        /// @brief 分发一个请求，总是返回响应
        HttpResponse handle(ServerRequest& request, std::stop_token stop = {});

        // --- 核心资源访问 ---
        const MeridianConfig& config() const { return config_; }
        Router& router() { return router_; }
        Kernel& kernel() { return kernel_; }
        ServiceContainer& container() { return container_; }
        const UrlGenerator& url() const { return url_; }
        bool booted() const { return booted_; }

    private:
        void log_routes() const;

        // 声明顺序即初始化顺序：配置最先
        MeridianConfig config_;
        ServiceContainer container_;
        Router router_;
        Kernel kernel_;
        UrlGenerator url_;
        std::vector<std::shared_ptr<HttpController>> controllers_;
        bool booted_ = false;
    };

} // namespace meridian

#endif //MERIDIAN_APP_HPP
