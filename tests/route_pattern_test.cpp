#include <gtest/gtest.h>

#include <meridian/error/exceptions.hpp>
#include <meridian/routing/route_pattern.hpp>

using namespace meridian;

TEST(RoutePatternTest, ConstrainedParameterMatchesDigitsOnly) {
    const auto pattern = RoutePattern::compile("/users/{id}", {{"id", "[0-9]+"}});

    const auto params = pattern.match("/users/42");
    ASSERT_TRUE(params);
    EXPECT_EQ(params->at("id"), "42");
    EXPECT_EQ(params->size(), 1u);

    EXPECT_FALSE(pattern.match("/users/abc"));
}

TEST(RoutePatternTest, OptionalParameterSwallowsPrecedingSlash) {
    const auto pattern = RoutePattern::compile("/posts/{slug?}");

    const auto empty = pattern.match("/posts");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());

    const auto filled = pattern.match("/posts/hello-world");
    ASSERT_TRUE(filled);
    EXPECT_EQ(filled->at("slug"), "hello-world");
}

TEST(RoutePatternTest, MatchIsAnchoredOnBothEnds) {
    const auto pattern = RoutePattern::compile("/users/{id}");
    EXPECT_FALSE(pattern.match("/api/users/1"));
    EXPECT_FALSE(pattern.match("/users/1/edit"));
    EXPECT_TRUE(pattern.match("/users/1"));
}

TEST(RoutePatternTest, PathMatchingIsCaseSensitive) {
    const auto pattern = RoutePattern::compile("/About");
    EXPECT_TRUE(pattern.match("/About"));
    EXPECT_FALSE(pattern.match("/about"));
}

TEST(RoutePatternTest, LiteralRegexCharactersAreEscaped) {
    const auto pattern = RoutePattern::compile("/files/report.pdf");
    EXPECT_TRUE(pattern.match("/files/report.pdf"));
    EXPECT_FALSE(pattern.match("/files/reportXpdf"));
}

TEST(RoutePatternTest, NamedPatternsAreAddressableByName) {
    const auto pattern = RoutePattern::compile("/orders/{order}", {{"order", "uuid"}});
    EXPECT_TRUE(pattern.match("/orders/123e4567-e89b-12d3-a456-426614174000"));
    EXPECT_FALSE(pattern.match("/orders/42"));

    EXPECT_EQ(RoutePattern::named_pattern("id"), "[0-9]+");
    EXPECT_FALSE(RoutePattern::named_pattern("unknown"));
}

TEST(RoutePatternTest, ExplicitConstraintWithCaptureGroupsKeepsParameterOrder) {
    const auto pattern = RoutePattern::compile("/{lang}/{page}", {{"lang", "(en|fr)"}});

    const auto params = pattern.match("/fr/contact");
    ASSERT_TRUE(params);
    EXPECT_EQ(params->at("lang"), "fr");
    EXPECT_EQ(params->at("page"), "contact");
}

TEST(RoutePatternTest, BindingKeyIsRecordedButMatchesLikePlainParameter) {
    const auto placeholders = RoutePattern::placeholders("/posts/{post:slug}");
    ASSERT_EQ(placeholders.size(), 1u);
    EXPECT_EQ(placeholders[0].name, "post");
    EXPECT_EQ(placeholders[0].binding_key, "slug");

    const auto pattern = RoutePattern::compile("/posts/{post:slug}");
    const auto params = pattern.match("/posts/hello");
    ASSERT_TRUE(params);
    EXPECT_EQ(params->at("post"), "hello");
}

TEST(RoutePatternTest, DomainTemplateCapturesSubdomain) {
    const auto pattern = RoutePattern::compile_domain("{tenant}.example.com");

    const auto params = pattern.match("acme.example.com");
    ASSERT_TRUE(params);
    EXPECT_EQ(params->at("tenant"), "acme");

    EXPECT_FALSE(pattern.match("example.com"));
}

TEST(RoutePatternTest, DomainMatchingIsCaseInsensitiveAndSupportsWildcard) {
    const auto pattern = RoutePattern::compile_domain("*.example.com");
    EXPECT_TRUE(pattern.match("API.Example.COM"));
    EXPECT_FALSE(pattern.match("a.b.example.com"));
}

TEST(RoutePatternTest, InvalidConstraintIsAConfigurationError) {
    EXPECT_THROW(RoutePattern::compile("/x/{id}", {{"id", "[0-9"}}), InvalidRouteDefinition);
}

TEST(RoutePatternTest, UnbalancedBraceIsTreatedAsLiteral) {
    const auto pattern = RoutePattern::compile("/odd/{name");
    EXPECT_TRUE(pattern.match("/odd/{name"));
    EXPECT_TRUE(pattern.parameter_names().empty());
}
