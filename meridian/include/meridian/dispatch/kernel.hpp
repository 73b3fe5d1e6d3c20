#ifndef MERIDIAN_KERNEL_HPP
#define MERIDIAN_KERNEL_HPP

#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>

#include <meridian/container/container.hpp>
#include <meridian/dispatch/argument_resolver.hpp>
#include <meridian/dispatch/middleware.hpp>
#include <meridian/http/http_common_types.hpp>
#include <meridian/http/server_request.hpp>
#include <meridian/utils/config/MeridianConfig.hpp>

namespace meridian {

    class Router;
    class Route;
    class RequestContext;

    /**
     * @struct DispatchResult
     * @brief 一次分发的结果：响应，或者匹配失败（ec + 允许的方法）。
     */
    struct DispatchResult {
        std::optional<HttpResponse> response;
        std::error_code ec;
        std::vector<http::verb> allowed_methods;
        const Route* route = nullptr;
        bool from_cache = false;

        bool ok() const { return response.has_value(); }
    };

    /**
     * @class Kernel
     * @brief 分发管道：方法解析 -> 匹配 -> 参数绑定 -> 中间件链 -> handler -> 响应规范化。
     */
    class Kernel {
    public:
        Kernel(Router& router, Container& container, const RouterConfig& router_config = {},
               const MiddlewareConfig& middleware_config = {});

        /// 全局中间件，位于每条路由自身的中间件之前
        Kernel& use(MiddlewareRef middleware);

        /// 中间件别名 -> 容器中的类型名
        Kernel& alias(std::string name, std::string type);

        /**
         * @brief 分发一个请求。
         *
         * 404 / 405 通过 DispatchResult::ec 返回；解析错误、handler 契约违规等以异常形式向上抛出。
         * @param stop 仅转发给 RequestContext，本层不做取消处理
         */
        DispatchResult dispatch(ServerRequest& request, std::stop_token stop = {});

        /**
         * @brief dispatch + 错误转换，总是返回一个可以直接发送的响应。
         *
         * ModelNotFound -> 404，ValidationFailed -> 422（JSON 错误包），BadRequestError -> 400，
         * 其他错误 -> 500（诊断信息只写日志）。
         */
        HttpResponse handle(ServerRequest& request, std::stop_token stop = {});

        /// 把匹配失败转换为 404 / 405（带 Allow 头）响应
        static HttpResponse to_response(const DispatchResult& result);

        Router& router() const { return router_; }

    private:
        std::shared_ptr<Middleware> resolve_middleware(const MiddlewareRef& ref) const;
        Action resolve_action(const Route& route) const;
        HttpResponse invoke(const Route& route, RequestContext& ctx) const;

        Router& router_;
        Container& container_;
        ArgumentResolver resolver_;
        bool method_override_;
        std::vector<MiddlewareRef> global_;
        std::map<std::string, std::string, std::less<>> aliases_;
    };

} // namespace meridian

#endif //MERIDIAN_KERNEL_HPP
