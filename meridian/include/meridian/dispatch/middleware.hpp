#ifndef MERIDIAN_MIDDLEWARE_HPP
#define MERIDIAN_MIDDLEWARE_HPP

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <meridian/http/http_common_types.hpp>

namespace meridian {

    class RequestContext;

    /// 中间件的 “下一步” continuation
    using Next = std::function<HttpResponse(RequestContext&)>;

    /**
     * @class Middleware
     * @brief 洋葱模型中间件。
     *
     * 调用 next(ctx) 继续向内传递，或直接返回自己的响应实现短路。
     * 需要处理 “出栈” 逻辑时，包装 next 的返回值后再返回即可。
     */
    class Middleware {
    public:
        virtual ~Middleware() = default;
        virtual HttpResponse handle(RequestContext& ctx, const Next& next) = 0;
    };

    using MiddlewareFunc = std::function<HttpResponse(RequestContext&, const Next&)>;

    /// 把 lambda 包装成 Middleware
    std::shared_ptr<Middleware> make_middleware(MiddlewareFunc fn);

    /**
     * @brief 路由上的中间件引用：名字（别名或容器类型名）或内联对象。
     * @note 内联对象无法写入持久化路由缓存。
     */
    using MiddlewareRef = std::variant<std::string, std::shared_ptr<Middleware>>;

    /// 日志 / 路由列表展示用
    std::string describe_middleware(const MiddlewareRef& ref);

    /**
     * @class MiddlewarePipeline
     * @brief 把一组中间件按顺序组合成单个调用链，最内层是 terminal。
     */
    class MiddlewarePipeline {
    public:
        MiddlewarePipeline() = default;
        explicit MiddlewarePipeline(std::vector<std::shared_ptr<Middleware>> stack) : stack_(std::move(stack)) {}

        void add(std::shared_ptr<Middleware> middleware) { stack_.push_back(std::move(middleware)); }

        size_t size() const { return stack_.size(); }

        HttpResponse run(RequestContext& ctx, const Next& terminal) const;

    private:
        HttpResponse call(size_t index, RequestContext& ctx, const Next& terminal) const;

        std::vector<std::shared_ptr<Middleware>> stack_;
    };

} // namespace meridian

#endif //MERIDIAN_MIDDLEWARE_HPP
