#ifndef BOOKSHELF_API_TOKEN_MIDDLEWARE_HPP
#define BOOKSHELF_API_TOKEN_MIDDLEWARE_HPP

#include <string>

#include <boost/json/object.hpp>

#include <meridian/dispatch/middleware.hpp>
#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>

namespace bookshelf {

    /// 写操作需要 X-Api-Token，校验通过后把调用方写入请求属性 "caller"
    class ApiTokenMiddleware final : public meridian::Middleware {
    public:
        explicit ApiTokenMiddleware(std::string token) : token_(std::move(token)) {}

        meridian::HttpResponse handle(meridian::RequestContext& ctx, const meridian::Next& next) override {
            const auto token = ctx.request().header("X-Api-Token");
            if (!token || *token != token_) {
                return meridian::response::json(boost::json::object{{"message", "Unauthenticated."}}, meridian::http::status::unauthorized);
            }
            ctx.request().set_attribute("caller", "api");
            return next(ctx);
        }

    private:
        std::string token_;
    };

} // namespace bookshelf

#endif //BOOKSHELF_API_TOKEN_MIDDLEWARE_HPP
