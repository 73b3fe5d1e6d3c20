#ifndef MERIDIAN_REQUEST_CONTEXT_HPP
#define MERIDIAN_REQUEST_CONTEXT_HPP

#include <any>
#include <initializer_list>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <meridian/http/http_common_types.hpp>
#include <meridian/http/parameter_set.hpp>
#include <meridian/http/server_request.hpp>
#include <meridian/utils/param_parser.hpp>

namespace meridian {

    class Route;
    class Router;

    /**
     * @class RequestContext
     * @brief 单次分发的上下文：当前请求、匹配到的路由、绑定的参数。
     *
     * 在分发开始时创建、结束时丢弃，沿中间件链与 handler 显式传递，不存放在任何全局变量中。
     */
    class RequestContext {
    public:
        RequestContext(ServerRequest& request, Router& router, std::stop_token stop = {});

        // --- 请求数据访问 ---

        ServerRequest& request() { return request_; }
        const ServerRequest& request() const { return request_; }

        Router& router() const { return router_; }

        /// 有效方法（方法覆盖与 HEAD -> GET 之后）
        http::verb method() const { return method_; }
        void set_method(const http::verb method) { method_ = method; }

        /// 由 Kernel 在匹配成功后调用
        void bind(const Route& route, PathParams params, bool from_cache);

        const Route* route() const { return route_; }
        bool from_cache() const { return from_cache_; }

        const PathParams& pathParams() const { return path_params_; }
        std::optional<std::string_view> pathParam(std::string_view key) const;
        std::optional<std::string_view> queryParam(std::string_view key) const;

        /// 类型化访问路由参数：ctx.params().get<int>("id")
        ParameterSet<PathParams> params() const { return ParameterSet<PathParams>(path_params_); }

        template<typename T>
        std::optional<T> path_param_as(const std::string_view key) const {
            const auto sv_opt = pathParam(key);
            if (!sv_opt) {
                return std::nullopt;
            }
            return param_parser::tryParse<T>(*sv_opt);
        }

        template<typename T>
        std::optional<T> query_param_as(const std::string_view key) const {
            const auto sv_opt = queryParam(key);
            if (!sv_opt) {
                return std::nullopt;
            }
            return param_parser::tryParse<T>(*sv_opt);
        }

        // --- 当前路由辅助 ---

        std::optional<std::string> route_name() const;

        /// 当前路由名称是否匹配任意一个模式（支持 `*` 通配）
        bool route_is(std::initializer_list<std::string_view> patterns) const;
        bool route_is(const std::vector<std::string>& patterns) const;

        /// 路由参数，不存在时返回 fallback
        std::string param(std::string_view key, std::string_view fallback = {}) const;

        /// 比较有效方法（大小写不敏感）
        bool is_method(std::string_view method) const;

        /// Accept 头包含 json，或者请求本身是 JSON
        bool wants_json() const;

        /// X-Requested-With: XMLHttpRequest
        bool is_ajax() const;

        // --- 取消 ---
        std::stop_token stop_token() const { return stop_; }
        bool stop_requested() const { return stop_.stop_requested(); }

        // --- 请求作用域存储（中间件之间传递对象） ---

        template<typename T>
        void set(std::string key, T value) {
            items_[std::move(key)] = std::move(value);
        }

        template<typename T>
        const T* get(std::string_view key) const {
            const auto it = items_.find(key);
            return it == items_.end() ? nullptr : std::any_cast<T>(&it->second);
        }

    private:
        ServerRequest& request_;
        Router& router_;
        std::stop_token stop_;
        http::verb method_;

        const Route* route_ = nullptr;
        PathParams path_params_;
        bool from_cache_ = false;

        std::map<std::string, std::any, std::less<>> items_;
    };

} // namespace meridian

#endif //MERIDIAN_REQUEST_CONTEXT_HPP
