#include <gtest/gtest.h>

#include <meridian/routing/match_cache.hpp>
#include <meridian/routing/router.hpp>

using namespace meridian;

namespace {
    HandlerResult ok(RequestContext&) { return "ok"; }
}

TEST(MatchCacheTest, OverflowEvictsOldestInsertedEntry) {
    Router router(RouterConfig{.match_cache_capacity = 2});
    router.GET("/items/{id}", ok);

    EXPECT_FALSE(router.resolve(http::verb::get, "/items/1").from_cache);
    EXPECT_FALSE(router.resolve(http::verb::get, "/items/2").from_cache);

    // 命中不会刷新位置
    EXPECT_TRUE(router.resolve(http::verb::get, "/items/1").from_cache);

    EXPECT_FALSE(router.resolve(http::verb::get, "/items/3").from_cache);
    EXPECT_EQ(router.match_cache().size(), 2u);

    // "/items/1" 是最早插入的，被淘汰后重新扫描
    EXPECT_FALSE(router.resolve(http::verb::get, "/items/1").from_cache);
    // 上一步重新插入 "/items/1" 时淘汰了 "/items/2"
    EXPECT_TRUE(router.resolve(http::verb::get, "/items/3").from_cache);
    EXPECT_FALSE(router.resolve(http::verb::get, "/items/2").from_cache);
}

TEST(MatchCacheTest, KeyIncludesMethodHostAndScheme) {
    MatchCache cache(10);
    Router router;
    const Route& route = router.GET("/", ok);

    cache.insert(http::verb::get, "/", "a.test", "http", &route);
    EXPECT_EQ(cache.find(http::verb::get, "/", "a.test", "http"), &route);
    EXPECT_EQ(cache.find(http::verb::post, "/", "a.test", "http"), nullptr);
    EXPECT_EQ(cache.find(http::verb::get, "/", "b.test", "http"), nullptr);
    EXPECT_EQ(cache.find(http::verb::get, "/", "a.test", "https"), nullptr);
}

TEST(MatchCacheTest, HostAndPathBoundariesDoNotCollide) {
    MatchCache cache(10);
    Router router;
    const Route& secret = router.GET("/secret", ok);

    cache.insert(http::verb::get, "/secret", "h/admin", "http", &secret);
    EXPECT_EQ(cache.find(http::verb::get, "/admin/secret", "h", "http"), nullptr);
    EXPECT_EQ(cache.find(http::verb::get, "/secret", "h/admin", "http"), &secret);
}

TEST(MatchCacheTest, StaleEntryIsRescannedInsteadOfReturned) {
    Router router;
    const Route& secret = router.GET("/secret", ok);
    const Route& admin = router.GET("/admin/secret", ok);

    router.match_cache().insert(http::verb::get, "/admin/secret", "h", "http", &secret);

    const RouteMatch match = router.resolve(http::verb::get, "/admin/secret", "h", "http");
    EXPECT_EQ(match.route, &admin);
    EXPECT_FALSE(match.from_cache);
    EXPECT_EQ(router.match_cache().find(http::verb::get, "/admin/secret", "h", "http"), &admin);
}

TEST(MatchCacheTest, ReinsertingAnExistingKeyDoesNotGrow) {
    MatchCache cache(2);
    Router router;
    const Route& first = router.GET("/", ok);
    const Route& second = router.POST("/", ok);

    cache.insert(http::verb::get, "/", "", "", &first);
    cache.insert(http::verb::get, "/", "", "", &second);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find(http::verb::get, "/", "", ""), &second);
}

TEST(MatchCacheTest, DisablingDropsEntries) {
    MatchCache cache(4);
    Router router;
    const Route& route = router.GET("/", ok);

    cache.insert(http::verb::get, "/", "", "", &route);
    cache.set_enabled(false);
    EXPECT_EQ(cache.size(), 0u);

    cache.insert(http::verb::get, "/", "", "", &route);
    EXPECT_EQ(cache.find(http::verb::get, "/", "", ""), nullptr);
}

TEST(MatchCacheTest, ZeroCapacityIsClampedToOne) {
    const MatchCache cache(0);
    EXPECT_EQ(cache.capacity(), 1u);
}
