#include <gtest/gtest.h>

#include <filesystem>

#include <meridian/App.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/routing/route_cache.hpp>

#include "test_support.hpp"

using namespace meridian;
using meridian::test_support::make_request;

namespace {

    class PingController final : public HttpController {
    public:
        PingController() {
            action("ping", {{param::string("name").with_default(std::string("world"))}, [](Arguments& args) -> HandlerResult {
                return "pong " + args.get<std::string>("name");
            }});
        }

        void registerRoutes(Router& router) override {
            router.GET("/ping", "PingController@ping").name("ping");
        }
    };

    MeridianConfig quiet_config(std::string cache_file = {}) {
        MeridianConfig config;
        config.logging.output_type = "none";
        config.app.url = "https://api.example.com";
        config.router.route_cache_file = std::move(cache_file);
        return config;
    }
}

TEST(AppTest, BootRegistersControllerAndCallbackRoutes) {
    App app(quiet_config());
    app.addController("PingController", std::make_shared<PingController>());
    app.boot([](Router& r) {
        r.GET("/", [](RequestContext&) -> HandlerResult { return "home"; }).name("home");
    });

    EXPECT_TRUE(app.booted());
    EXPECT_EQ(app.router().routes().size(), 2u);
    EXPECT_EQ(app.url().route("ping", {{"name", "ann"}}, true), "https://api.example.com/ping?name=ann");

    auto ping = make_request(http::verb::get, "/ping?name=bob");
    EXPECT_EQ(app.handle(ping).body(), "pong bob");

    auto home = make_request(http::verb::get, "/");
    EXPECT_EQ(app.handle(home).body(), "home");

    auto missing = make_request(http::verb::get, "/nope");
    EXPECT_EQ(app.handle(missing).result(), http::status::not_found);
}

TEST(AppTest, SecondBootIsIgnored) {
    App app(quiet_config());
    app.addController("PingController", std::make_shared<PingController>());
    app.boot();
    app.boot();
    EXPECT_EQ(app.router().routes().size(), 1u);
}

TEST(AppTest, RoutesAreRestoredFromCacheFile) {
    const auto file = (std::filesystem::temp_directory_path() / "meridian_app_routes.json").string();
    std::filesystem::remove(file);

    {
        App first(quiet_config(file));
        first.addController("PingController", std::make_shared<PingController>());
        first.boot();
        first.cacheRoutes();
    }
    ASSERT_TRUE(std::filesystem::exists(file));

    App second(quiet_config(file));
    second.addController("PingController", std::make_shared<PingController>());
    second.boot();

    EXPECT_EQ(second.router().routes().size(), 1u);
    EXPECT_TRUE(second.router().has_route("ping"));

    auto ping = make_request(http::verb::get, "/ping");
    EXPECT_EQ(second.handle(ping).body(), "pong world");

    std::filesystem::remove(file);
}

TEST(AppTest, CachingClosuresFails) {
    const auto file = (std::filesystem::temp_directory_path() / "meridian_app_closure_routes.json").string();
    App app(quiet_config(file));
    app.boot([](Router& r) {
        r.GET("/", [](RequestContext&) -> HandlerResult { return "home"; });
    });
    EXPECT_THROW(app.cacheRoutes(), UncacheableHandler);
}

TEST(AppTest, MiddlewareAliasesComeFromConfig) {
    MeridianConfig config = quiet_config();
    config.middleware.aliases["stamp"] = "StampMiddleware";

    App app(std::move(config));
    app.container().singleton<Middleware>("StampMiddleware", make_middleware([](RequestContext& ctx, const Next& next) {
        HttpResponse res = next(ctx);
        res.set("X-Stamp", "1");
        return res;
    }));
    app.boot([](Router& r) {
        r.GET("/", [](RequestContext&) -> HandlerResult { return "home"; }, {"stamp"});
    });

    auto request = make_request(http::verb::get, "/");
    EXPECT_EQ(app.handle(request)["X-Stamp"], "1");
}
