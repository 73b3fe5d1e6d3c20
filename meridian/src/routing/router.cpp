#include <meridian/routing/router.hpp>
#include <meridian/error/meridian_error.hpp>
#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>
#include <meridian/utils/finally.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace meridian {

    namespace {
        // 资源路由的固定动作顺序
        constexpr std::string_view kResourceActions[] = {"index", "create", "store", "show", "edit", "update", "destroy"};

        bool contains(const std::vector<std::string>& list, const std::string_view value) {
            return std::ranges::find(list, value) != list.end();
        }
    }

    // --- 构造与析构 ---
    Router::Router(const RouterConfig& config)
        : config_(config),
          cache_(config.match_cache_capacity) {
        cache_.set_enabled(config.match_cache_enabled);
        scopes_.emplace_back();
    }

    Router::~Router() = default;


    // --- 路由注册实现 ---

    Route& Router::add_route(const http::verb method, const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        const GroupFrame& scope = current_scope();

        // 分组中间件在前，路由自身的中间件在后
        std::vector<MiddlewareRef> stack = scope.middleware;
        stack.insert(stack.end(), std::make_move_iterator(middleware.begin()), std::make_move_iterator(middleware.end()));

        auto route = std::make_unique<Route>(method, normalize_path(path), qualify_handler(std::move(handler)), std::move(stack), this);
        route->name_prefix_ = scope.name_prefix;
        if (!scope.where.empty()) {
            route->where(scope.where);
        }
        if (scope.domain) {
            route->domain(*scope.domain);
        }

        Route& ref = *route;
        routes_.push_back(std::move(route));
        by_method_[method].push_back(&ref);

        // 新注册的路由可能比缓存中的结果更早匹配（例如 fallback 之前缓存的 405）
        cache_.clear();

        SPDLOG_DEBUG("注册路由：{} {} -> {}", method_name(method), ref.path(), ref.handler().describe());
        return ref;
    }

    Route& Router::GET(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::get, path, std::move(handler), std::move(middleware));
    }

    Route& Router::POST(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::post, path, std::move(handler), std::move(middleware));
    }

    Route& Router::PUT(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::put, path, std::move(handler), std::move(middleware));
    }

    Route& Router::PATCH(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::patch, path, std::move(handler), std::move(middleware));
    }

    Route& Router::DELETE(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::delete_, path, std::move(handler), std::move(middleware));
    }

    Route& Router::OPTIONS(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::options, path, std::move(handler), std::move(middleware));
    }

    Route& Router::HEAD(const std::string_view path, HandlerRef handler, std::vector<MiddlewareRef> middleware) {
        return add_route(http::verb::head, path, std::move(handler), std::move(middleware));
    }

    Route& Router::match(const std::vector<std::string>& methods, const std::string_view path, const HandlerRef& handler,
                         const std::vector<MiddlewareRef>& middleware) {
        if (methods.empty()) {
            SPDLOG_ERROR("match() on '{}' called without any HTTP method", path);
            throw InvalidRouteDefinition("At least one HTTP method must be specified");
        }

        // 先整体校验，避免注册到一半才发现非法方法
        std::vector<http::verb> verbs;
        verbs.reserve(methods.size());
        for (const auto& m : methods) {
            verbs.push_back(parse_method(m));
        }

        Route* last = nullptr;
        for (const auto verb : verbs) {
            last = &add_route(verb, path, handler, middleware);
        }
        return *last;
    }

    Route& Router::any(const std::string_view path, const HandlerRef& handler, const std::vector<MiddlewareRef>& middleware) {
        Route* last = nullptr;
        for (const auto verb : kRoutableMethods) {
            last = &add_route(verb, path, handler, middleware);
        }
        return *last;
    }

    std::vector<Route*> Router::resource(const std::string_view name, const std::string& controller, const ResourceOptions& options) {
        return register_resource(name, controller, options, false);
    }

    std::vector<Route*> Router::api_resource(const std::string_view name, const std::string& controller, const ResourceOptions& options) {
        return register_resource(name, controller, options, true);
    }

    std::vector<Route*> Router::register_resource(const std::string_view name, const std::string& controller,
                                                  const ResourceOptions& options, const bool api) {
        const std::string base = trim_slashes(name);
        if (base.empty()) {
            SPDLOG_ERROR("Resource registered for '{}' without a name", controller);
            throw InvalidRouteDefinition("Resource name must not be empty");
        }

        // "admin/photos" -> 路由名 "admin.photos.index"
        std::string name_base = base;
        std::ranges::replace(name_base, '/', '.');

        const std::string item = "/" + base + "/{" + options.parameter + "}";
        std::vector<Route*> registered;

        for (const auto action_sv : kResourceActions) {
            const std::string action(action_sv);
            if (api && (action == "create" || action == "edit")) continue;
            if (!options.only.empty() && !contains(options.only, action)) continue;
            if (contains(options.except, action)) continue;

            const HandlerRef handler(controller, action);
            Route* route = nullptr;
            if (action == "index") {
                route = &add_route(http::verb::get, "/" + base, handler, options.middleware);
            } else if (action == "create") {
                route = &add_route(http::verb::get, "/" + base + "/create", handler, options.middleware);
            } else if (action == "store") {
                route = &add_route(http::verb::post, "/" + base, handler, options.middleware);
            } else if (action == "show") {
                route = &add_route(http::verb::get, item, handler, options.middleware);
            } else if (action == "edit") {
                route = &add_route(http::verb::get, item + "/edit", handler, options.middleware);
            } else if (action == "update") {
                route = &add_route(http::verb::put, item, handler, options.middleware);
            } else {
                route = &add_route(http::verb::delete_, item, handler, options.middleware);
            }

            const auto custom = options.names.find(action);
            route->name(custom != options.names.end() ? custom->second : name_base + "." + action);
            registered.push_back(route);

            // PATCH 与 PUT 共用 update 动作，不单独命名
            if (action == "update") {
                registered.push_back(&add_route(http::verb::patch, item, handler, options.middleware));
            }
        }
        return registered;
    }

    void Router::group(const GroupAttributes& attributes, const std::function<void(Router&)>& routes) {
        scopes_.push_back(current_scope().merged(attributes));
        // 无论回调是否抛出，都恢复到进入前的作用域
        auto pop = make_finally([this]() noexcept { scopes_.pop_back(); });
        routes(*this);
    }

    Route& Router::fallback(HandlerRef handler) {
        auto route = std::make_unique<Route>(http::verb::get, "/{fallbackPlaceholder}", qualify_handler(std::move(handler)),
                                             current_scope().middleware, this);
        route->where("fallbackPlaceholder", ".*");
        fallback_ = std::move(route);
        cache_.clear();
        return *fallback_;
    }

    Route& Router::redirect(const std::string_view from, std::string to, const unsigned status) {
        return any(from, Action([to = std::move(to), status](RequestContext&) -> HandlerResult {
            return response::redirect(to, status);
        }));
    }

    Route& Router::permanent_redirect(const std::string_view from, std::string to) {
        return redirect(from, std::move(to), 301);
    }


    // --- 链式分组属性 ---

    RouteRegistrar Router::prefix(std::string prefix) {
        return RouteRegistrar(*this).prefix(std::move(prefix));
    }

    RouteRegistrar Router::middleware(MiddlewareRef middleware) {
        return RouteRegistrar(*this).middleware(std::move(middleware));
    }

    RouteRegistrar Router::middleware(std::vector<MiddlewareRef> middleware) {
        return RouteRegistrar(*this).middleware(middleware);
    }

    RouteRegistrar Router::name_space(std::string name_space) {
        return RouteRegistrar(*this).name_space(std::move(name_space));
    }

    RouteRegistrar Router::domain(std::string domain) {
        return RouteRegistrar(*this).domain(std::move(domain));
    }

    RouteRegistrar Router::where(ConstraintMap where) {
        return RouteRegistrar(*this).where(where);
    }

    RouteRegistrar Router::as(std::string name_prefix) {
        return RouteRegistrar(*this).as(std::move(name_prefix));
    }


    // --- 名称索引 ---

    void Router::register_named_route(const std::string& name, Route& route) {
        if (named_.contains(name)) {
            SPDLOG_ERROR("Duplicate route name '{}' for {} {}", name, method_name(route.method()), route.path());
            throw DuplicateRouteName(name);
        }
        named_.emplace(name, &route);
    }

    void Router::forget_route_name(const std::string& name) {
        named_.erase(name);
    }

    const Route* Router::route_by_name(const std::string_view name) const {
        const auto it = named_.find(name);
        return it == named_.end() ? nullptr : it->second;
    }

    bool Router::has_route(const std::string_view name) const {
        return named_.find(name) != named_.end();
    }


    // --- 路由解析实现 ---

    RouteMatch Router::resolve(const http::verb method, const std::string_view path, const std::string_view host, const std::string_view scheme) {
        RouteMatch result;

        // 命中后再校验一次，不一致时按未命中处理（扫描结果会覆盖这条缓存）
        if (const Route* cached = cache_.find(method, path, host, scheme); cached && cached->matches(method, path, host, scheme)) {
            result.route = cached;
            result.from_cache = true;
            return result;
        }

        // 注册顺序即优先级：第一条匹配的路由胜出
        if (const auto it = by_method_.find(method); it != by_method_.end()) {
            for (const Route* route : it->second) {
                if (route->matches(method, path, host, scheme)) {
                    cache_.insert(method, path, host, scheme, route);
                    result.route = route;
                    return result;
                }
            }
        }

        result.allowed_methods = find_allowed_methods(method, path, host, scheme);
        if (!result.allowed_methods.empty()) {
            SPDLOG_DEBUG("405 {} {} (allowed: {})", method_name(method), path, join_methods(result.allowed_methods));
            result.ec = meridian_error::routing::method_not_allowed;
            return result;
        }

        if (fallback_) {
            result.route = fallback_.get();
            result.fallback = true;
            return result;
        }

        SPDLOG_DEBUG("404 {} {}", method_name(method), path);
        result.ec = meridian_error::routing::not_found;
        return result;
    }

    std::vector<http::verb> Router::find_allowed_methods(const http::verb method, const std::string_view path,
                                                         const std::string_view host, const std::string_view scheme) const {
        std::vector<http::verb> allowed;
        for (const auto verb : kRoutableMethods) {
            if (verb == method) continue;
            const auto it = by_method_.find(verb);
            if (it == by_method_.end()) continue;

            const bool any_match = std::ranges::any_of(it->second, [&](const Route* route) {
                return route->matches_ignoring_method(path, host, scheme);
            });
            if (any_match) allowed.push_back(verb);
        }
        return allowed;
    }


    // --- 路由表访问 ---

    std::vector<const Route*> Router::routes() const {
        std::vector<const Route*> out;
        out.reserve(routes_.size());
        for (const auto& route : routes_) {
            out.push_back(route.get());
        }
        return out;
    }

    std::vector<const Route*> Router::routes(const http::verb method) const {
        const auto it = by_method_.find(method);
        if (it == by_method_.end()) return {};
        return {it->second.begin(), it->second.end()};
    }

    void Router::clear() {
        by_method_.clear();
        named_.clear();
        routes_.clear();
        fallback_.reset();
        cache_.clear();
        scopes_.clear();
        scopes_.emplace_back();
    }


    // --- 私有辅助函数 ---

    std::string Router::normalize_path(const std::string_view path) const {
        return "/" + trim_slashes(current_scope().prefix + "/" + trim_slashes(path));
    }

    HandlerRef Router::qualify_handler(HandlerRef handler) const {
        const std::string& ns = current_scope().name_space;

        auto qualify = [&ns](std::string& target) {
            if (target.starts_with("::")) {
                // 以 "::" 开头表示全限定名，去掉前导的 "::"
                target.erase(0, 2);
            } else if (!ns.empty() && target.find("::") == std::string::npos) {
                target = ns + "::" + target;
            }
        };

        if (auto* action = std::get_if<ControllerAction>(&handler.storage())) {
            qualify(action->target);
        } else if (auto* invokable = std::get_if<InvokableTarget>(&handler.storage())) {
            qualify(invokable->target);
        }
        return handler;
    }

} // namespace meridian
