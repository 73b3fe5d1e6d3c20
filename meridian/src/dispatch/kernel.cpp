#include <meridian/dispatch/kernel.hpp>
#include <meridian/dispatch/decorators.hpp>
#include <meridian/dispatch/method_override.hpp>
#include <meridian/dispatch/response_normalizer.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/error/meridian_error.hpp>
#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>
#include <meridian/routing/router.hpp>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <spdlog/spdlog.h>

namespace meridian {

    Kernel::Kernel(Router& router, Container& container, const RouterConfig& router_config,
                   const MiddlewareConfig& middleware_config)
        : router_(router),
          container_(container),
          resolver_(container),
          method_override_(router_config.method_override),
          aliases_(middleware_config.aliases) {
    }

    Kernel& Kernel::use(MiddlewareRef middleware) {
        global_.push_back(std::move(middleware));
        return *this;
    }

    Kernel& Kernel::alias(std::string name, std::string type) {
        aliases_.insert_or_assign(std::move(name), std::move(type));
        return *this;
    }

    DispatchResult Kernel::dispatch(ServerRequest& request, std::stop_token stop) {
        RequestContext ctx(request, router_, std::move(stop));

        // 1. 方法解析
        ctx.set_method(effective_method(request, method_override_));

        // 2. 匹配
        const std::string_view path = request.path();
        const std::string host = request.host();
        const RouteMatch match = router_.resolve(ctx.method(), path, host, request.scheme());

        DispatchResult result;
        if (!match.route) {
            result.ec = match.ec;
            result.allowed_methods = match.allowed_methods;
            return result;
        }

        // 3. 参数绑定：域名参数 + 路径参数（含默认值）
        PathParams params = match.route->extract_domain_parameters(host);
        for (auto& [key, value] : match.route->extract_parameters(path)) {
            params.insert_or_assign(key, std::move(value));
        }
        ctx.bind(*match.route, std::move(params), match.from_cache);

        // 4. 中间件链：全局中间件在前，路由中间件在后
        MiddlewarePipeline pipeline;
        for (const auto& ref : global_) {
            pipeline.add(resolve_middleware(ref));
        }
        for (const auto& ref : match.route->middleware()) {
            pipeline.add(resolve_middleware(ref));
        }

        const Route& route = *match.route;
        result.response = pipeline.run(ctx, [this, &route](RequestContext& c) { return invoke(route, c); });
        result.route = match.route;
        result.from_cache = match.from_cache;
        return result;
    }

    HttpResponse Kernel::handle(ServerRequest& request, std::stop_token stop) {
        try {
            DispatchResult result = dispatch(request, std::move(stop));
            if (result.ok()) {
                return std::move(*result.response);
            }
            return to_response(result);
        } catch (const ModelNotFound& e) {
            SPDLOG_DEBUG("{}", e.what());
            return response::text("404 Not Found", http::status::not_found);
        } catch (const ValidationFailed& e) {
            boost::json::object errors;
            for (const auto& [field, messages] : e.errors()) {
                boost::json::array list;
                for (const auto& m : messages) list.emplace_back(m);
                errors[field] = std::move(list);
            }
            boost::json::object body;
            body["message"] = e.what();
            body["errors"] = std::move(errors);
            return response::json(body, http::status::unprocessable_entity);
        } catch (const BadRequestError& e) {
            SPDLOG_DEBUG("Bad request {} {}: {}", method_name(request.method()), request.target(), e.what());
            return response::text("400 Bad Request", http::status::bad_request);
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Dispatch of {} {} failed: {}", method_name(request.method()), request.target(), e.what());
            return response::text("500 Internal Server Error", http::status::internal_server_error);
        }
    }

    HttpResponse Kernel::to_response(const DispatchResult& result) {
        if (result.response) {
            return *result.response;
        }
        if (result.ec == meridian_error::routing::method_not_allowed) {
            HttpResponse res = response::text("405 Method Not Allowed", http::status::method_not_allowed);
            res.set(http::field::allow, join_methods(result.allowed_methods));
            return res;
        }
        return response::text("404 Not Found", http::status::not_found);
    }

    std::shared_ptr<Middleware> Kernel::resolve_middleware(const MiddlewareRef& ref) const {
        if (const auto* inline_mw = std::get_if<std::shared_ptr<Middleware>>(&ref)) {
            return *inline_mw;
        }

        const std::string& name = std::get<std::string>(ref);
        std::string type = name;
        if (const auto it = aliases_.find(name); it != aliases_.end()) {
            type = it->second;
        } else if (!container_.has(name)) {
            SPDLOG_ERROR("Unknown middleware '{}'", name);
            throw InvalidRouteDefinition("Middleware [" + name + "] is neither an alias nor a registered type");
        }

        Resolution resolution = container_.resolve(type);
        if (!resolution.middleware) {
            throw InvalidRouteDefinition("Type [" + type + "] is not a middleware");
        }
        return resolution.middleware;
    }

    Action Kernel::resolve_action(const Route& route) const {
        const HandlerRef& handler = route.handler();

        Action action;
        if (const auto* inline_action = std::get_if<Action>(&handler.storage())) {
            action = *inline_action;
        } else {
            const std::string target = handler.target();
            const std::string method = handler.method();

            Resolution resolution = container_.resolve(target);
            if (!resolution.controller) {
                throw MissingTarget(target);
            }
            const Action* found = resolution.controller->find_action(method);
            if (!found) {
                SPDLOG_WARN("Route {} points at missing action {}@{}", route.path(), target, method);
                throw MissingTargetMethod(target, method);
            }
            // 动作闭包可能捕获了控制器本身，持有 controller 保证调用期间存活
            action = Action(found->parameters, [controller = resolution.controller, fn = found->invoke](Arguments& args) {
                return fn(args);
            });
        }

        return decorators::apply(std::move(action), route.decorators());
    }

    HttpResponse Kernel::invoke(const Route& route, RequestContext& ctx) const {
        const Action action = resolve_action(route);
        Arguments args = resolver_.resolve(action.parameters, ctx);
        return normalize_response(action.invoke(args));
    }

} // namespace meridian
