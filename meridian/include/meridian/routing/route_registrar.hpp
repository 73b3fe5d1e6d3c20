#ifndef MERIDIAN_ROUTE_REGISTRAR_HPP
#define MERIDIAN_ROUTE_REGISTRAR_HPP

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <meridian/routing/group_scope.hpp>
#include <meridian/routing/handler.hpp>

namespace meridian {

    class Router;
    class Route;
    struct ResourceOptions;

    /**
     * @class RouteRegistrar
     * @brief 链式收集分组属性，然后在这些属性形成的分组内注册路由。
     *
     * @code
     * router.prefix("admin").middleware("auth").as("admin.").group([](Router& r) {
     *     r.GET("/users", "UserController@index").name("users"); // admin.users
     * });
     * @endcode
     */
    class RouteRegistrar {
    public:
        explicit RouteRegistrar(Router& router) : router_(router) {}

        RouteRegistrar& prefix(std::string prefix);
        RouteRegistrar& middleware(MiddlewareRef middleware);
        RouteRegistrar& middleware(const std::vector<MiddlewareRef>& middleware);
        RouteRegistrar& name_space(std::string name_space);
        RouteRegistrar& domain(std::string domain);
        RouteRegistrar& where(const ConstraintMap& where);
        RouteRegistrar& as(std::string name_prefix);
        /// 版本前缀，等价于 prefix(version)
        RouteRegistrar& version(std::string version);

        void group(const std::function<void(Router&)>& routes);

        Route& GET(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& POST(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& PUT(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& PATCH(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& DELETE(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& OPTIONS(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& any(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware = {});
        Route& match(const std::vector<std::string>& methods, std::string_view path, const HandlerRef& handler,
                     const std::vector<MiddlewareRef>& middleware = {});

        std::vector<Route*> resource(std::string_view name, const std::string& controller);
        std::vector<Route*> resource(std::string_view name, const std::string& controller, const ResourceOptions& options);
        std::vector<Route*> api_resource(std::string_view name, const std::string& controller);
        std::vector<Route*> api_resource(std::string_view name, const std::string& controller, const ResourceOptions& options);

        const GroupAttributes& attributes() const { return attributes_; }

    private:
        Route& single(const std::function<Route&(Router&)>& registration);

        Router& router_;
        GroupAttributes attributes_;
    };

} // namespace meridian

#endif //MERIDIAN_ROUTE_REGISTRAR_HPP
