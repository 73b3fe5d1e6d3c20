#ifndef MERIDIAN_ROUTER_HPP
#define MERIDIAN_ROUTER_HPP

#include <any>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <meridian/error/exceptions.hpp>
#include <meridian/http/http_common_types.hpp>
#include <meridian/routing/group_scope.hpp>
#include <meridian/routing/handler.hpp>
#include <meridian/routing/match_cache.hpp>
#include <meridian/routing/method.hpp>
#include <meridian/routing/route.hpp>
#include <meridian/routing/route_registrar.hpp>
#include <meridian/utils/config/MeridianConfig.hpp>

namespace meridian {

    /**
     * @struct RouteMatch
     * @brief Router::resolve 的结果。
     *
     * - route 非空：命中（或命中 fallback，此时 fallback 为 true）
     * - route 为空：ec 为 not_found 或 method_not_allowed，后者附带允许的方法集合
     */
    struct RouteMatch {
        const Route* route = nullptr;
        bool from_cache = false;
        bool fallback = false;
        std::error_code ec;
        std::vector<http::verb> allowed_methods;
    };

    /**
     * @struct ResourceOptions
     * @brief resource() / api_resource() 的选项。
     */
    struct ResourceOptions {
        std::vector<std::string> only;                              // 只生成这些动作
        std::vector<std::string> except;                            // 排除这些动作
        std::string parameter = "id";                               // 标识参数名
        std::map<std::string, std::string, std::less<>> names;      // 动作 -> 自定义路由名
        std::vector<MiddlewareRef> middleware;
    };

    /**
     * @class Router
     * @brief 路由表：按方法存放路由（注册顺序即优先级）、分组作用域栈、名称索引、匹配缓存。
     *
     * 启动阶段注册完成后视为只读，唯一的运行期可变状态是匹配缓存（内部加锁）。
     */
    class Router {
    public:
        explicit Router(const RouterConfig& config = {});
        ~Router();

        Router(const Router&) = delete;
        Router& operator=(const Router&) = delete;

        // --- 路由注册 API ---
        Route& GET(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& POST(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& PUT(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& PATCH(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& DELETE(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& OPTIONS(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});
        Route& HEAD(std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});

        /**
         * @brief 为多个方法注册同一个 handler，每个方法一条路由。
         * @return 最后注册的那条路由
         * @throws InvalidMethod 方法字符串不合法
         * @throws InvalidRouteDefinition 方法列表为空
         */
        Route& match(const std::vector<std::string>& methods, std::string_view path, const HandlerRef& handler,
                     const std::vector<MiddlewareRef>& middleware = {});

        /// 为全部动词注册
        Route& any(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});

        /**
         * @brief 生成 CRUD 路由组：index, create, store, show, edit, update(+PATCH), destroy。
         * @return 按注册顺序返回生成的路由
         */
        std::vector<Route*> resource(std::string_view name, const std::string& controller, const ResourceOptions& options = {});

        /// 与 resource 相同，但不生成 create / edit
        std::vector<Route*> api_resource(std::string_view name, const std::string& controller, const ResourceOptions& options = {});

        /**
         * @brief 在分组作用域内注册路由。
         *
         * 回调返回（包括抛出异常）后，作用域栈恢复到进入前的状态，嵌套分组同样适用。
         */
        void group(const GroupAttributes& attributes, const std::function<void(Router&)>& routes);

        /// 其他路由都不匹配（且不构成 405）时使用的兜底路由
        Route& fallback(HandlerRef handler);

        /// 注册一个重定向路由（全部动词）
        Route& redirect(std::string_view from, std::string to, unsigned status = 302);
        Route& permanent_redirect(std::string_view from, std::string to);

        // --- 链式分组属性（返回 RouteRegistrar） ---
        RouteRegistrar prefix(std::string prefix);
        RouteRegistrar middleware(MiddlewareRef middleware);
        RouteRegistrar middleware(std::vector<MiddlewareRef> middleware);
        RouteRegistrar name_space(std::string name_space);
        RouteRegistrar domain(std::string domain);
        RouteRegistrar where(ConstraintMap where);
        RouteRegistrar as(std::string name_prefix);

        // --- 名称索引 ---

        /// @throws DuplicateRouteName
        void register_named_route(const std::string& name, Route& route);
        void forget_route_name(const std::string& name);
        const Route* route_by_name(std::string_view name) const;
        bool has_route(std::string_view name) const;
        const std::map<std::string, Route*, std::less<>>& named_routes() const { return named_; }

        // --- 匹配 ---

        /**
         * @brief 匹配策略：先查缓存；未命中则按注册顺序扫描该方法下的路由，第一条匹配的胜出。
         *        扫描失败时：其他方法能匹配该路径 -> 405；否则有 fallback -> fallback；否则 404。
         * @param method 有效方法（已完成方法覆盖与 HEAD -> GET）
         */
        RouteMatch resolve(http::verb method, std::string_view path, std::string_view host = {}, std::string_view scheme = {});

        /**
         * @brief 检查除 method 以外，哪些方法下存在能匹配该路径的路由。
         */
        std::vector<http::verb> find_allowed_methods(http::verb method, std::string_view path,
                                                     std::string_view host = {}, std::string_view scheme = {}) const;

        // --- 路由表访问 ---

        /// 全部路由，按注册顺序
        std::vector<const Route*> routes() const;
        /// 某个方法下的路由，按注册顺序
        std::vector<const Route*> routes(http::verb method) const;
        const Route* fallback_route() const { return fallback_.get(); }

        MatchCache& match_cache() { return cache_; }
        void clear_match_cache() { cache_.clear(); }

        const RouterConfig& config() const { return config_; }

        /// 清空所有路由、名称与缓存（测试用）
        void clear();

        // --- 宏：按名字注册的扩展函数 ---

        template<typename R, typename... Args>
        void macro(const std::string& name, std::function<R(Router&, Args...)> fn) {
            macros_[name] = std::move(fn);
        }

        bool has_macro(std::string_view name) const { return macros_.contains(name); }

        /// @throws InvalidRouteDefinition 宏不存在或签名不符
        template<typename R = void, typename... Args>
        R call_macro(std::string_view name, Args&&... args) {
            const auto it = macros_.find(name);
            if (it == macros_.end()) {
                throw InvalidRouteDefinition("Macro [" + std::string(name) + "] does not exist");
            }
            using Fn = std::function<R(Router&, std::decay_t<Args>...)>;
            const auto* fn = std::any_cast<Fn>(&it->second);
            if (!fn) {
                throw InvalidRouteDefinition("Macro [" + std::string(name) + "] called with a mismatched signature");
            }
            return (*fn)(*this, std::forward<Args>(args)...);
        }

        /**
         * @brief 不经过路径规范化以外任何处理、直接在当前作用域注册一条路由。
         *        各动词方法、match、resource 以及持久化缓存的恢复都走这里。
         */
        Route& add_route(http::verb method, std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware = {});

    private:
        std::vector<Route*> register_resource(std::string_view name, const std::string& controller,
                                              const ResourceOptions& options, bool api);

        const GroupFrame& current_scope() const { return scopes_.back(); }
        std::string normalize_path(std::string_view path) const;
        HandlerRef qualify_handler(HandlerRef handler) const;

        RouterConfig config_;
        std::vector<std::unique_ptr<Route>> routes_;
        std::unordered_map<http::verb, std::vector<Route*>> by_method_;
        std::map<std::string, Route*, std::less<>> named_;
        std::unique_ptr<Route> fallback_;
        MatchCache cache_;
        // 作用域栈，栈底是根作用域
        std::vector<GroupFrame> scopes_;
        std::unordered_map<std::string, std::any, StringHash, StringEqual> macros_;
    };

} // namespace meridian

#endif //MERIDIAN_ROUTER_HPP
