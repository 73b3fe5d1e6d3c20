#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <meridian/dispatch/response_normalizer.hpp>
#include <meridian/error/exceptions.hpp>
#include <meridian/http/response_factory.hpp>

using namespace meridian;

namespace {
    struct Money final : Stringable {
        std::string to_string() const override { return "12.50 EUR"; }
    };

    struct Unsupported {};

    std::string content_type(const HttpResponse& res) {
        return std::string(res[http::field::content_type]);
    }
}

TEST(ResponseNormalizerTest, ResponsesPassThrough) {
    const HttpResponse res = normalize_response(response::text("teapot", http::status::im_a_teapot));
    EXPECT_EQ(res.result(), http::status::im_a_teapot);
    EXPECT_EQ(res.body(), "teapot");
}

TEST(ResponseNormalizerTest, StringsBecomeHtml) {
    const HttpResponse res = normalize_response("<p>hi</p>");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "<p>hi</p>");
    EXPECT_NE(content_type(res).find("text/html"), std::string::npos);
}

TEST(ResponseNormalizerTest, ObjectsAndArraysBecomeJson) {
    const HttpResponse object = normalize_response(boost::json::object{{"id", 1}});
    EXPECT_NE(content_type(object).find("application/json"), std::string::npos);
    EXPECT_EQ(boost::json::parse(object.body()), (boost::json::value{{"id", 1}}));

    const HttpResponse array = normalize_response(boost::json::array{1, 2, 3});
    EXPECT_EQ(array.body(), "[1,2,3]");
}

TEST(ResponseNormalizerTest, NullBecomesNoContent) {
    EXPECT_EQ(normalize_response(nullptr).result(), http::status::no_content);
    EXPECT_EQ(normalize_response(HandlerResult{}).result(), http::status::no_content);
    EXPECT_EQ(normalize_response(boost::json::value(nullptr)).result(), http::status::no_content);
}

TEST(ResponseNormalizerTest, BooleansBecomeSuccessEnvelope) {
    const HttpResponse res = normalize_response(false);
    EXPECT_EQ(boost::json::parse(res.body()), (boost::json::value{{"success", false}}));
    EXPECT_NE(content_type(res).find("application/json"), std::string::npos);
}

TEST(ResponseNormalizerTest, NumbersBecomeHtmlText) {
    EXPECT_EQ(normalize_response(42).body(), "42");
    EXPECT_EQ(normalize_response(2.5).body(), "2.5");
    EXPECT_NE(content_type(normalize_response(7)).find("text/html"), std::string::npos);
}

TEST(ResponseNormalizerTest, StringableObjectsUseToString) {
    const HttpResponse res = normalize_response(std::shared_ptr<const Stringable>(std::make_shared<const Money>()));
    EXPECT_EQ(res.body(), "12.50 EUR");
}

TEST(ResponseNormalizerTest, UnknownTypesAreRejectedWithTheirName) {
    try {
        normalize_response(HandlerResult::opaque(Unsupported{}));
        FAIL() << "expected InvalidHandlerReturn";
    } catch (const InvalidHandlerReturn& e) {
        EXPECT_NE(e.actual_type().find("Unsupported"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Unsupported"), std::string::npos);
    }
}

TEST(ResponseFactoryTest, RedirectSetsLocation) {
    const HttpResponse res = response::redirect("/login", 301);
    EXPECT_EQ(res.result_int(), 301u);
    EXPECT_EQ(res[http::field::location], "/login");
}

TEST(ResponseFactoryTest, BuilderCollectsStatusHeadersAndBody) {
    ResponseBuilder builder;
    builder.status(http::status::created).header("X-Trace", "abc").json(boost::json::object{{"ok", true}});

    const HttpResponse res = builder.build();
    EXPECT_EQ(res.result(), http::status::created);
    EXPECT_EQ(res["X-Trace"], "abc");
    EXPECT_EQ(res.body(), R"({"ok":true})");
}
