#include <gtest/gtest.h>

#include <meridian/dispatch/method_override.hpp>

#include "test_support.hpp"

using namespace meridian;
using meridian::test_support::make_form_request;
using meridian::test_support::make_json_request;
using meridian::test_support::make_request;

TEST(MethodOverrideTest, BodyFieldOverridesPost) {
    const auto request = make_form_request(http::verb::post, "/posts/1", "_method=DELETE");
    EXPECT_EQ(effective_method(request), http::verb::delete_);
}

TEST(MethodOverrideTest, DisallowedOverrideIsIgnored) {
    const auto request = make_form_request(http::verb::post, "/posts/1", "_method=GET");
    EXPECT_EQ(effective_method(request), http::verb::post);
}

TEST(MethodOverrideTest, BodyWinsOverQueryAndHeader) {
    const auto request = make_request(http::verb::post, "/posts/1?_method=PUT", "_method=patch",
                                      "application/x-www-form-urlencoded", {{"X-HTTP-Method-Override", "DELETE"}});
    EXPECT_EQ(effective_method(request), http::verb::patch);
}

TEST(MethodOverrideTest, QueryWinsOverHeader) {
    const auto request = make_request(http::verb::post, "/posts/1?_method=PUT", {}, {},
                                      {{"X-HTTP-Method-Override", "DELETE"}});
    EXPECT_EQ(effective_method(request), http::verb::put);
}

TEST(MethodOverrideTest, HeaderIsConsultedLast) {
    const auto request = make_request(http::verb::post, "/posts/1", {}, {}, {{"X-HTTP-Method-Override", "PATCH"}});
    EXPECT_EQ(effective_method(request), http::verb::patch);
}

TEST(MethodOverrideTest, FirstPresentSignalWinsEvenWhenRejected) {
    // body 里的 GET 不被接受，也不会回退到查询参数
    const auto request = make_request(http::verb::post, "/posts/1?_method=DELETE", "_method=GET",
                                      "application/x-www-form-urlencoded");
    EXPECT_EQ(effective_method(request), http::verb::post);
}

TEST(MethodOverrideTest, JsonBodyFieldIsHonoured) {
    const auto request = make_json_request(http::verb::post, "/posts/1", R"({"_method":"PUT"})");
    EXPECT_EQ(effective_method(request), http::verb::put);
}

TEST(MethodOverrideTest, OnlyPostIsOverridden) {
    const auto request = make_request(http::verb::get, "/posts/1?_method=DELETE");
    EXPECT_EQ(effective_method(request), http::verb::get);
}

TEST(MethodOverrideTest, OverrideCanBeDisabled) {
    const auto request = make_form_request(http::verb::post, "/posts/1", "_method=DELETE");
    EXPECT_EQ(effective_method(request, false), http::verb::post);
}

TEST(MethodOverrideTest, HeadMatchesAsGet) {
    const auto request = make_request(http::verb::head, "/");
    EXPECT_EQ(effective_method(request), http::verb::get);
}
