#include <cstdio>
#include <exception>
#include <memory>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <meridian/App.hpp>
#include <meridian/dispatch/decorators.hpp>
#include <meridian/http/request_context.hpp>
#include <meridian/http/response_factory.hpp>
#include <meridian/http/server_request.hpp>
#include <meridian/utils/logger_manager.hpp>

#include "controller/BookController.hpp"
#include "middleware/ApiTokenMiddleware.hpp"
#include "model/BookRepository.hpp"
#include "model/StoreBookRequest.hpp"

namespace {

    meridian::HttpResponse send(meridian::App& app, const meridian::http::verb method, const std::string& target,
                                std::string body = {}, const bool with_token = false) {
        meridian::HttpRequest raw{method, target, 11};
        raw.set(meridian::http::field::host, "localhost");
        if (!body.empty()) {
            raw.set(meridian::http::field::content_type, "application/json");
            raw.body() = std::move(body);
            raw.prepare_payload();
        }
        if (with_token) {
            raw.set("X-Api-Token", "secret");
        }
        meridian::ServerRequest request(std::move(raw), "http", "127.0.0.1");
        auto response = app.handle(request);
        SPDLOG_INFO("{} {} -> {} {}", meridian::method_name(method), target, response.result_int(), response.body());
        return response;
    }

}

int main() {
    try {
        // 1. 初始化
        meridian::App app("config.toml");

        // 2. 组装业务
        auto books = std::make_shared<bookshelf::BookRepository>();
        app.container().bind_model("Book", books);
        app.container().bind<bookshelf::StoreBookRequest>("StoreBookRequest", [] {
            return std::make_shared<bookshelf::StoreBookRequest>();
        });
        app.container().singleton<bookshelf::ApiTokenMiddleware>("ApiTokenMiddleware",
                                                                 std::make_shared<bookshelf::ApiTokenMiddleware>("secret"));
        app.kernel().alias("api.token", "ApiTokenMiddleware");
        app.addController("BookController", std::make_shared<bookshelf::BookController>(books));

        // 3. 注册路由（存在路由缓存时直接恢复）
        app.boot([](meridian::Router& router) {
            router.GET("/", [](meridian::RequestContext&) -> meridian::HandlerResult {
                return "<h1>Bookshelf</h1>";
            }).name("home");

            router.GET("/health", [](meridian::RequestContext&) -> meridian::HandlerResult {
                return boost::json::object{{"status", "ok"}};
            }).decorate(meridian::decorators::cache_control(30));

            router.permanent_redirect("/library", "/books");

            router.fallback([](meridian::RequestContext& ctx) -> meridian::HandlerResult {
                return meridian::response::json(boost::json::object{{"message", "Nothing here: " + std::string(ctx.request().path())}},
                                                meridian::http::status::not_found);
            });
        });

        SPDLOG_INFO("books.show -> {}", app.url().route("books.show", {{"book", "1"}}));
        SPDLOG_INFO("books.search -> {}", app.url().route("books.search", {{"q", "C++"}}, true));

        // 4. 演示几次分发
        using meridian::http::verb;
        send(app, verb::get, "/books");
        send(app, verb::get, "/books/2");
        send(app, verb::get, "/books/by-slug/effective-modern-c");
        send(app, verb::get, "/books/42");
        send(app, verb::get, "/books/search?q=C%2B%2B&limit=1");
        send(app, verb::post, "/books", R"({"title":"A Tour of C++"})", true);
        send(app, verb::post, "/books", R"({"title":"A Tour of C++","author":"Bjarne Stroustrup"})");
        send(app, verb::post, "/books", R"({"title":"A Tour of C++","author":"Bjarne Stroustrup"})", true);
        send(app, verb::post, "/books/3?_method=DELETE", {}, true);
        send(app, verb::put, "/health");
        send(app, verb::get, "/nowhere");

        meridian::LoggerManager::shutdown();
        return 0;
    } catch (const std::exception& e) {
        // 配置文件不存在、路由定义错误等启动期异常
        std::fprintf(stderr, "Critical Error during startup: %s\n", e.what());
        return 1;
    }
}
