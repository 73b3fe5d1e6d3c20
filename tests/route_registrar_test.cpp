#include <gtest/gtest.h>

#include <meridian/routing/route_registrar.hpp>
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

TEST(RouteRegistrarTest, ChainedAttributesApplyToGroup) {
    Router router;
    router.prefix("admin").middleware("auth").as("admin.").group([](Router& r) {
        r.GET("/users", "UserController@index").name("users");
        r.prefix("reports").as("reports.").group([](Router& inner) {
            inner.GET("/daily", "ReportController@daily").name("daily");
        });
    });

    const Route* users = router.route_by_name("admin.users");
    ASSERT_NE(users, nullptr);
    EXPECT_EQ(users->path(), "/admin/users");
    EXPECT_EQ(middleware_names(*users), (std::vector<std::string>{"auth"}));

    const Route* daily = router.route_by_name("admin.reports.daily");
    ASSERT_NE(daily, nullptr);
    EXPECT_EQ(daily->path(), "/admin/reports/daily");
}

TEST(RouteRegistrarTest, SingleRouteRegistrationUsesAttributes) {
    Router router;
    Route& route = router.prefix("api").version("v2").middleware(std::vector<MiddlewareRef>{"auth", "throttle"})
                         .GET("/status", ok);

    EXPECT_EQ(route.path(), "/api/v2/status");
    EXPECT_EQ(middleware_names(route), (std::vector<std::string>{"auth", "throttle"}));

    // 分组属性只作用于这一次注册
    EXPECT_EQ(router.GET("/plain", ok).path(), "/plain");
    EXPECT_TRUE(router.GET("/plain2", ok).middleware().empty());
}

TEST(RouteRegistrarTest, NamespaceQualifiesHandlerTargets) {
    Router router;
    router.name_space("admin").group([](Router& r) {
        r.GET("/a", "UserController@index");
        r.GET("/b", "::billing::InvoiceController@index");
        r.GET("/c", "reports::ReportController");
    });

    const auto routes = router.routes();
    ASSERT_EQ(routes.size(), 3u);
    EXPECT_EQ(routes[0]->handler().describe(), "admin::UserController@index");
    EXPECT_EQ(routes[1]->handler().describe(), "billing::InvoiceController@index");
    EXPECT_EQ(routes[2]->handler().describe(), "reports::ReportController");
}

TEST(RouteRegistrarTest, DomainAndWhereApplyToRoutes) {
    Router router;
    Route& route = router.domain("{account}.example.com").where({{"id", "[0-9]+"}}).GET("/items/{id}", ok);

    EXPECT_EQ(route.domain(), "{account}.example.com");
    EXPECT_EQ(route.wheres().at("id"), "[0-9]+");
    EXPECT_NE(router.resolve(http::verb::get, "/items/5", "acme.example.com").route, nullptr);
    EXPECT_EQ(router.resolve(http::verb::get, "/items/x", "acme.example.com").route, nullptr);
    EXPECT_EQ(router.resolve(http::verb::get, "/items/5", "other.org").route, nullptr);
}

TEST(RouteRegistrarTest, MatchAndAnyThroughRegistrar) {
    Router router;
    router.prefix("forms").match({"GET", "POST"}, "/contact", ok);
    router.prefix("hooks").any("/incoming", ok);

    EXPECT_EQ(router.routes(http::verb::get).size(), 2u);
    EXPECT_EQ(router.routes(http::verb::post).size(), 2u);
    EXPECT_EQ(router.routes(http::verb::delete_).size(), 1u);
    EXPECT_NE(router.resolve(http::verb::post, "/forms/contact").route, nullptr);
    EXPECT_NE(router.resolve(http::verb::patch, "/hooks/incoming").route, nullptr);
}

TEST(RouteRegistrarTest, ResourcesThroughRegistrar) {
    Router router;
    const auto routes = router.prefix("admin").as("admin.").resource("photos", "PhotoController");
    ASSERT_EQ(routes.size(), 8u);
    EXPECT_EQ(routes.front()->path(), "/admin/photos");
    EXPECT_TRUE(router.has_route("admin.photos.index"));
    EXPECT_TRUE(router.has_route("admin.photos.destroy"));

    const auto api = router.prefix("api").api_resource("tags", "TagController");
    EXPECT_EQ(api.size(), 6u);
    EXPECT_FALSE(router.has_route("tags.create"));
    EXPECT_TRUE(router.has_route("tags.show"));
}

TEST(RouteRegistrarTest, AttributesAccumulate) {
    Router router;
    RouteRegistrar registrar = router.prefix("a");
    registrar.prefix("b").as("x.").as("y.").middleware("one").middleware("two");

    const GroupAttributes& attrs = registrar.attributes();
    EXPECT_EQ(attrs.prefix, "a/b");
    EXPECT_EQ(attrs.as, "x.y.");
    EXPECT_EQ(attrs.middleware.size(), 2u);
}
