#include <gtest/gtest.h>

#include <meridian/error/exceptions.hpp>
#include <meridian/error/meridian_error.hpp>
#include <meridian/routing/router.hpp>

using namespace meridian;

namespace {
    HandlerResult ok(RequestContext&) { return "ok"; }

    std::vector<std::string> middleware_names(const Route& route) {
        std::vector<std::string> names;
        for (const auto& m : route.middleware()) names.push_back(describe_middleware(m));
        return names;
    }
}

TEST(RouterTest, FirstRegisteredRouteWins) {
    Router router;
    const Route& first = router.GET("/a", "HandlerX");
    router.GET("/a", "HandlerY");

    const RouteMatch match = router.resolve(http::verb::get, "/a");
    ASSERT_NE(match.route, nullptr);
    EXPECT_EQ(match.route, &first);
    EXPECT_EQ(match.route->handler().target(), "HandlerX");
}

TEST(RouterTest, UnknownPathIsNotFound) {
    Router router;
    router.GET("/a", ok);

    const RouteMatch match = router.resolve(http::verb::get, "/b");
    EXPECT_EQ(match.route, nullptr);
    EXPECT_EQ(match.ec, meridian_error::routing::not_found);
}

TEST(RouterTest, OtherMethodMatchingReportsMethodNotAllowed) {
    Router router;
    router.GET("/items", ok);
    router.DELETE("/items", ok);

    const RouteMatch match = router.resolve(http::verb::post, "/items");
    EXPECT_EQ(match.route, nullptr);
    EXPECT_EQ(match.ec, meridian_error::routing::method_not_allowed);
    const std::vector<http::verb> expected{http::verb::get, http::verb::delete_};
    EXPECT_EQ(match.allowed_methods, expected);
}

TEST(RouterTest, MethodNotAllowedTakesPrecedenceOverFallback) {
    Router router;
    router.GET("/items", ok);
    router.fallback(ok);

    EXPECT_EQ(router.resolve(http::verb::put, "/items").ec, meridian_error::routing::method_not_allowed);

    const RouteMatch fallback = router.resolve(http::verb::get, "/missing/deep/path");
    ASSERT_NE(fallback.route, nullptr);
    EXPECT_TRUE(fallback.fallback);
    EXPECT_EQ(fallback.route, router.fallback_route());
    EXPECT_FALSE(fallback.ec);
}

TEST(RouterTest, FallbackAnswersAnyMethod) {
    Router router;
    router.fallback(ok);
    EXPECT_TRUE(router.resolve(http::verb::patch, "/nothing").fallback);
}

TEST(RouterTest, MatchRegistersOneRoutePerMethodAndReturnsTheLast) {
    Router router;
    Route& last = router.match({"get", "POST"}, "/form", ok);

    EXPECT_EQ(last.method(), http::verb::post);
    EXPECT_EQ(router.routes(http::verb::get).size(), 1u);
    EXPECT_EQ(router.routes(http::verb::post).size(), 1u);
}

TEST(RouterTest, MatchValidatesEveryMethodBeforeRegistering) {
    Router router;
    EXPECT_THROW(router.match({"GET", "BREW"}, "/coffee", ok), InvalidMethod);
    EXPECT_TRUE(router.routes().empty());
    EXPECT_THROW(router.match({}, "/nothing", ok), InvalidRouteDefinition);
}

TEST(RouterTest, AnyRegistersEveryVerb) {
    Router router;
    router.any("/ping", ok);
    EXPECT_EQ(router.routes().size(), kRoutableMethods.size());
    for (const auto verb : kRoutableMethods) {
        EXPECT_EQ(router.routes(verb).size(), 1u) << method_name(verb);
    }
}

TEST(RouterTest, PathsAreNormalized) {
    Router router;
    EXPECT_EQ(router.GET("users/", ok).path(), "/users");
    EXPECT_EQ(router.GET("/", ok).path(), "/");
}

TEST(RouterTest, GroupAppendsPrefixMiddlewareAndWhere) {
    Router router;
    Route* inner = nullptr;
    Route* outer = nullptr;

    router.group({.prefix = "api", .middleware = {"auth"}, .where = {{"id", "[0-9]+"}}}, [&](Router& r) {
        outer = &r.GET("/status", ok);
        r.group({.prefix = "/v1/", .middleware = {"throttle"}}, [&](Router& nested) {
            inner = &nested.GET("/users/{id}", ok, {"log"});
        });
    });
    Route& root = router.GET("/users/{id}", ok);

    EXPECT_EQ(outer->path(), "/api/status");
    EXPECT_EQ(inner->path(), "/api/v1/users/{id}");
    EXPECT_EQ(middleware_names(*inner), (std::vector<std::string>{"auth", "throttle", "log"}));
    EXPECT_TRUE(inner->matches(http::verb::get, "/api/v1/users/5"));
    EXPECT_FALSE(inner->matches(http::verb::get, "/api/v1/users/x"));

    // 分组结束后作用域完全恢复
    EXPECT_EQ(root.path(), "/users/{id}");
    EXPECT_TRUE(root.middleware().empty());
    EXPECT_TRUE(root.matches(http::verb::get, "/users/x"));
}

TEST(RouterTest, GroupScopeIsRestoredWhenCallbackThrows) {
    Router router;
    EXPECT_THROW(router.group({.prefix = "admin", .middleware = {"auth"}}, [](Router& r) {
        r.GET("/broken", ok);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    Route& after = router.GET("/after", ok);
    EXPECT_EQ(after.path(), "/after");
    EXPECT_TRUE(after.middleware().empty());
}

TEST(RouterTest, GroupReplacesNamespaceAndDomain) {
    Router router;
    Route* qualified = nullptr;
    Route* absolute = nullptr;
    Route* already = nullptr;
    Route* replaced = nullptr;

    router.group({.name_space = "App::Http", .domain = "{tenant}.example.com"}, [&](Router& r) {
        qualified = &r.GET("/a", "UserController@index");
        absolute = &r.GET("/b", "::Global@index");
        already = &r.GET("/c", "Other::Controller@index");
        r.group({.name_space = "Admin", .domain = "admin.example.com"}, [&](Router& nested) {
            replaced = &nested.GET("/d", "Dashboard");
        });
    });

    EXPECT_EQ(qualified->handler().target(), "App::Http::UserController");
    EXPECT_EQ(absolute->handler().target(), "Global");
    EXPECT_EQ(already->handler().target(), "Other::Controller");
    EXPECT_EQ(replaced->handler().target(), "Admin::Dashboard");
    EXPECT_EQ(qualified->domain(), "{tenant}.example.com");
    EXPECT_EQ(replaced->domain(), "admin.example.com");
}

TEST(RouterTest, GroupNamePrefixesAccumulate) {
    Router router;
    router.group({.as = "admin."}, [](Router& r) {
        r.group({.as = "users."}, [](Router& nested) {
            nested.GET("/users", ok).name("index");
        });
    });
    EXPECT_TRUE(router.has_route("admin.users.index"));
}

TEST(RouterTest, ResourceGeneratesTheCrudSet) {
    Router router;
    const auto routes = router.resource("photos", "PhotoController");

    ASSERT_EQ(routes.size(), 8u);
    const std::vector<std::pair<http::verb, std::string>> expected{
        {http::verb::get, "/photos"},
        {http::verb::get, "/photos/create"},
        {http::verb::post, "/photos"},
        {http::verb::get, "/photos/{id}"},
        {http::verb::get, "/photos/{id}/edit"},
        {http::verb::put, "/photos/{id}"},
        {http::verb::patch, "/photos/{id}"},
        {http::verb::delete_, "/photos/{id}"},
    };
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(routes[i]->method(), expected[i].first) << i;
        EXPECT_EQ(routes[i]->path(), expected[i].second) << i;
    }

    EXPECT_EQ(router.route_by_name("photos.update")->method(), http::verb::put);
    EXPECT_FALSE(routes[6]->name());
    EXPECT_EQ(router.route_by_name("photos.show")->handler().describe(), "PhotoController@show");
}

TEST(RouterTest, ShowRouteRegisteredAfterCreateDoesNotShadowIt) {
    Router router;
    router.resource("photos", "PhotoController");

    const RouteMatch match = router.resolve(http::verb::get, "/photos/create");
    ASSERT_NE(match.route, nullptr);
    EXPECT_EQ(match.route->handler().method(), "create");
}

TEST(RouterTest, ApiResourceSkipsFormRoutesAndHonoursOptions) {
    Router router;
    const auto routes = router.api_resource("admin/photos", "PhotoController",
                                            {.except = {"destroy"}, .parameter = "photo", .names = {{"index", "gallery"}}});

    ASSERT_EQ(routes.size(), 5u);
    EXPECT_TRUE(router.has_route("gallery"));
    EXPECT_TRUE(router.has_route("admin.photos.show"));
    EXPECT_FALSE(router.has_route("admin.photos.create"));
    EXPECT_FALSE(router.has_route("admin.photos.destroy"));
    EXPECT_EQ(router.route_by_name("admin.photos.show")->path(), "/admin/photos/{photo}");
}

TEST(RouterTest, ResourceOnlyLimitsActions) {
    Router router;
    const auto routes = router.resource("tags", "TagController", {.only = {"index", "show"}});
    EXPECT_EQ(routes.size(), 2u);
    EXPECT_THROW(router.resource("/", "TagController"), InvalidRouteDefinition);
}

TEST(RouterTest, RegistrationClearsTheMatchCache) {
    Router router;
    router.GET("/a", ok);
    router.resolve(http::verb::get, "/a");
    EXPECT_EQ(router.match_cache().size(), 1u);

    router.GET("/b", ok);
    EXPECT_EQ(router.match_cache().size(), 0u);
}

TEST(RouterTest, CacheHitIsReported) {
    Router router;
    router.GET("/a", ok);

    EXPECT_FALSE(router.resolve(http::verb::get, "/a").from_cache);
    EXPECT_TRUE(router.resolve(http::verb::get, "/a").from_cache);
}

TEST(RouterTest, DisabledCacheNeverHits) {
    Router router(RouterConfig{.match_cache_enabled = false});
    router.GET("/a", ok);
    router.resolve(http::verb::get, "/a");
    EXPECT_FALSE(router.resolve(http::verb::get, "/a").from_cache);
}

TEST(RouterTest, DomainRoutesAreCachedPerHost) {
    Router router;
    const Route& tenant = router.GET("/home", "TenantHome").domain("{tenant}.example.com");
    const Route& plain = router.GET("/home", "Home");

    EXPECT_EQ(router.resolve(http::verb::get, "/home", "acme.example.com").route, &tenant);
    EXPECT_EQ(router.resolve(http::verb::get, "/home", "localhost").route, &plain);
    EXPECT_EQ(router.resolve(http::verb::get, "/home", "acme.example.com").route, &tenant);
}

TEST(RouterTest, RedirectRegistersEveryVerb) {
    Router router;
    router.permanent_redirect("/old", "/new");

    EXPECT_EQ(router.routes().size(), kRoutableMethods.size());
    EXPECT_TRUE(router.resolve(http::verb::post, "/old").route->has_inline_parts());
}

TEST(RouterTest, MacrosAreCalledByName) {
    Router router;
    router.macro<Route&, std::string>("health", std::function<Route&(Router&, std::string)>(
        [](Router& r, std::string path) -> Route& { return r.GET(path, "HealthCheck").name("health"); }));

    EXPECT_TRUE(router.has_macro("health"));
    Route& route = router.call_macro<Route&>("health", std::string("/up"));
    EXPECT_EQ(route.path(), "/up");
    EXPECT_TRUE(router.has_route("health"));

    EXPECT_THROW(router.call_macro("missing"), InvalidRouteDefinition);
    EXPECT_THROW(router.call_macro<Route&>("health", 42), InvalidRouteDefinition);
}

TEST(RouterTest, RoutesListInRegistrationOrder) {
    Router router;
    router.POST("/b", ok);
    router.GET("/a", ok);

    const auto routes = router.routes();
    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0]->path(), "/b");
    EXPECT_EQ(routes[1]->path(), "/a");
}

TEST(RouterTest, ClearResetsEverything) {
    Router router;
    router.GET("/a", ok).name("a");
    router.fallback(ok);
    router.clear();

    EXPECT_TRUE(router.routes().empty());
    EXPECT_FALSE(router.has_route("a"));
    EXPECT_EQ(router.fallback_route(), nullptr);
}

TEST(RouterTest, IndependentRoutersDoNotShareNames) {
    Router first;
    Router second;
    first.GET("/", ok).name("home");
    EXPECT_NO_THROW(second.GET("/", ok).name("home"));
}
