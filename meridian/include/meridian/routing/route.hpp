#ifndef MERIDIAN_ROUTE_HPP
#define MERIDIAN_ROUTE_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json/object.hpp>

#include <meridian/dispatch/middleware.hpp>
#include <meridian/http/http_common_types.hpp>
#include <meridian/routing/handler.hpp>
#include <meridian/routing/route_pattern.hpp>

namespace meridian {

    class Router;

    /**
     * @class Route
     * @brief 单条路由注册：方法 + 路径模板 + handler，以及约束、中间件、名称等配置。
     *
     * 生命周期：由 Router 在注册时创建，定义阶段通过链式调用修改，启动完成后只读。
     * 不变式：编译好的匹配器永远与当前 path + 约束一致，任何约束修改都会立即重新编译。
     */
    class Route {
    public:
        Route(http::verb method, std::string path, HandlerRef handler,
              std::vector<MiddlewareRef> middleware = {}, Router* router = nullptr);

        // --- 链式配置 ---

        Route& middleware(MiddlewareRef middleware);
        Route& middleware(const std::vector<MiddlewareRef>& middleware);

        /**
         * @brief 设置路由名称，并注册到所属 Router 的名称索引中（会加上分组的名称前缀）。
         * @throws DuplicateRouteName 名称已存在
         */
        Route& name(const std::string& name);

        /// 添加参数约束并重新编译
        Route& where(const std::string& key, const std::string& pattern);
        Route& where(const ConstraintMap& constraints);

        /// 可选参数的默认值
        Route& defaults(const std::string& key, const std::string& value);
        Route& defaults(const DefaultMap& values);

        /// 限定域名（同时编译域名匹配器）
        Route& domain(const std::string& domain);

        /**
         * @brief 限定协议。
         * @throws InvalidScheme 不是 http / https
         */
        Route& scheme(const std::string& scheme);

        Route& meta(const std::string& key, boost::json::value value);

        /// 模型绑定时使用的备用查找字段（等价于模板中的 `{param:key}`）
        Route& bind_field(const std::string& param, const std::string& field);

        /// 追加 handler 装饰器，后追加的位于最外层
        Route& decorate(Decorator decorator);

        // --- 匹配 ---

        /**
         * @brief 依次检查：方法 -> 域名 -> 协议 -> 路径。
         * @param host 请求的主机名（不含端口），未设置域名约束时忽略
         * @param scheme 请求协议，未设置协议约束时忽略
         */
        bool matches(http::verb method, std::string_view path, std::string_view host = {}, std::string_view scheme = {}) const;

        /// 与 matches 相同，但不检查方法（405 判定用）
        bool matches_ignoring_method(std::string_view path, std::string_view host = {}, std::string_view scheme = {}) const;

        /// 提取路径参数，缺失或为空的可选参数用注册的默认值填充
        PathParams extract_parameters(std::string_view path) const;

        /// 提取域名参数（未设置域名时返回空表）
        PathParams extract_domain_parameters(std::string_view host) const;

        // --- 访问器 ---

        http::verb method() const { return method_; }
        const std::string& path() const { return path_; }
        const HandlerRef& handler() const { return handler_; }
        const std::vector<MiddlewareRef>& middleware() const { return middleware_; }
        const std::optional<std::string>& name() const { return name_; }
        const ConstraintMap& wheres() const { return wheres_; }
        const DefaultMap& defaults() const { return defaults_; }
        const std::optional<std::string>& domain() const { return domain_; }
        const std::optional<std::string>& scheme() const { return scheme_; }
        const boost::json::object& meta() const { return meta_; }
        const std::map<std::string, std::string, std::less<>>& binding_fields() const { return binding_fields_; }
        const std::vector<Decorator>& decorators() const { return decorators_; }
        const RoutePattern& pattern() const { return pattern_; }

        /// 路径模板中的参数名（按出现顺序），以及域名模板中的参数名
        std::vector<std::string> parameter_names() const;

        /// 路由上是否存在内联闭包（handler、中间件或装饰器），有则无法写入持久化缓存
        bool has_inline_parts() const;

    private:
        friend class Router;

        void recompile();
        bool matches_host_and_scheme(std::string_view host, std::string_view scheme) const;

        Router* router_;
        http::verb method_;
        std::string path_;
        HandlerRef handler_;
        std::vector<MiddlewareRef> middleware_;
        std::optional<std::string> name_;
        std::string name_prefix_;
        ConstraintMap wheres_;
        DefaultMap defaults_;
        std::optional<std::string> domain_;
        std::optional<RoutePattern> domain_pattern_;
        std::optional<std::string> scheme_;
        boost::json::object meta_;
        std::map<std::string, std::string, std::less<>> binding_fields_;
        std::vector<Decorator> decorators_;
        RoutePattern pattern_;
    };

} // namespace meridian

#endif //MERIDIAN_ROUTE_HPP
