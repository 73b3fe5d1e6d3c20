#include <meridian/routing/route_registrar.hpp>
#include <meridian/routing/router.hpp>

namespace meridian {

    RouteRegistrar& RouteRegistrar::prefix(std::string prefix) {
        if (attributes_.prefix) {
            attributes_.prefix = *attributes_.prefix + "/" + trim_slashes(prefix);
        } else {
            attributes_.prefix = std::move(prefix);
        }
        return *this;
    }

    RouteRegistrar& RouteRegistrar::middleware(MiddlewareRef middleware) {
        attributes_.middleware.push_back(std::move(middleware));
        return *this;
    }

    RouteRegistrar& RouteRegistrar::middleware(const std::vector<MiddlewareRef>& middleware) {
        attributes_.middleware.insert(attributes_.middleware.end(), middleware.begin(), middleware.end());
        return *this;
    }

    RouteRegistrar& RouteRegistrar::name_space(std::string name_space) {
        attributes_.name_space = std::move(name_space);
        return *this;
    }

    RouteRegistrar& RouteRegistrar::domain(std::string domain) {
        attributes_.domain = std::move(domain);
        return *this;
    }

    RouteRegistrar& RouteRegistrar::where(const ConstraintMap& where) {
        for (const auto& [key, pattern] : where) {
            attributes_.where[key] = pattern;
        }
        return *this;
    }

    RouteRegistrar& RouteRegistrar::as(std::string name_prefix) {
        attributes_.as = attributes_.as ? *attributes_.as + name_prefix : std::move(name_prefix);
        return *this;
    }

    RouteRegistrar& RouteRegistrar::version(std::string version) {
        return prefix(std::move(version));
    }

    void RouteRegistrar::group(const std::function<void(Router&)>& routes) {
        router_.group(attributes_, routes);
    }

    Route& RouteRegistrar::single(const std::function<Route&(Router&)>& registration) {
        Route* route = nullptr;
        router_.group(attributes_, [&](Router& r) { route = &registration(r); });
        return *route;
    }

    Route& RouteRegistrar::GET(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.GET(path, handler, middleware); });
    }

    Route& RouteRegistrar::POST(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.POST(path, handler, middleware); });
    }

    Route& RouteRegistrar::PUT(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.PUT(path, handler, middleware); });
    }

    Route& RouteRegistrar::PATCH(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.PATCH(path, handler, middleware); });
    }

    Route& RouteRegistrar::DELETE(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.DELETE(path, handler, middleware); });
    }

    Route& RouteRegistrar::OPTIONS(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.OPTIONS(path, handler, middleware); });
    }

    Route& RouteRegistrar::any(std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.any(path, handler, middleware); });
    }

    Route& RouteRegistrar::match(const std::vector<std::string>& methods, std::string_view path, const HandlerRef& handler,
                                 const std::vector<MiddlewareRef>& middleware) {
        return single([&](Router& r) -> Route& { return r.match(methods, path, handler, middleware); });
    }

    std::vector<Route*> RouteRegistrar::resource(std::string_view name, const std::string& controller) {
        return resource(name, controller, ResourceOptions{});
    }

    std::vector<Route*> RouteRegistrar::resource(std::string_view name, const std::string& controller, const ResourceOptions& options) {
        std::vector<Route*> routes;
        router_.group(attributes_, [&](Router& r) { routes = r.resource(name, controller, options); });
        return routes;
    }

    std::vector<Route*> RouteRegistrar::api_resource(std::string_view name, const std::string& controller) {
        return api_resource(name, controller, ResourceOptions{});
    }

    std::vector<Route*> RouteRegistrar::api_resource(std::string_view name, const std::string& controller, const ResourceOptions& options) {
        std::vector<Route*> routes;
        router_.group(attributes_, [&](Router& r) { routes = r.api_resource(name, controller, options); });
        return routes;
    }

} // namespace meridian
