#include <gtest/gtest.h>

#include "centy/version_resolver.hpp"
#include "testing.hpp"

namespace centy {

namespace {

constexpr const char* kReleasesUrl = "https://api.example.test/repos/centy-io/centy-daemon/releases";

VersionResolver::Options TestOptions() {
    VersionResolver::Options opt;
    opt.api_base = "https://api.example.test/";
    opt.repository = "centy-io/centy-daemon";
    return opt;
}

} // namespace

TEST(NormalizeVersionTagTest, PrefixesMissingV) {
    EXPECT_EQ(NormalizeVersionTag("0.1.0"), "v0.1.0");
    EXPECT_EQ(NormalizeVersionTag("v0.1.0"), "v0.1.0");
    EXPECT_EQ(NormalizeVersionTag("  1.2.3\n"), "v1.2.3");
    EXPECT_EQ(NormalizeVersionTag("0.2.0-beta.1"), "v0.2.0-beta.1");
}

TEST(VersionResolverTest, ExplicitVersionSkipsNetwork) {
    testutil::FakeHttpClient http;
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::string("0.1.0"));
    ASSERT_TRUE(tag.has_value()) << tag.error();
    EXPECT_EQ(*tag, "v0.1.0");
    EXPECT_TRUE(http.Requests().empty());
}

TEST(VersionResolverTest, ReleasesUrlTrimsTrailingSlash) {
    testutil::FakeHttpClient http;
    VersionResolver resolver(http, TestOptions());
    EXPECT_EQ(resolver.ReleasesUrl(), kReleasesUrl);
}

TEST(VersionResolverTest, AbsentVersionTakesFirstListedRelease) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, R"([{"tag_name":"v0.3.0"},{"tag_name":"v0.2.0"}])");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_TRUE(tag.has_value()) << tag.error();
    EXPECT_EQ(*tag, "v0.3.0");
    ASSERT_EQ(http.Requests().size(), 1u);
    const auto& headers = http.Requests()[0].headers;
    EXPECT_NE(std::find(headers.begin(), headers.end(), "Accept: application/vnd.github+json"), headers.end());
}

TEST(VersionResolverTest, EmptyAndLatestMeanNewest) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, R"([{"tag_name":"v0.3.0"}])");
    VersionResolver resolver(http, TestOptions());

    EXPECT_EQ(resolver.Resolve(std::string("")).value_or(""), "v0.3.0");
    EXPECT_EQ(resolver.Resolve(std::string("  latest ")).value_or(""), "v0.3.0");
    EXPECT_EQ(http.Requests().size(), 2u);
}

TEST(VersionResolverTest, PrereleaseIsEligibleByDefault) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200,
                 R"([{"tag_name":"v0.4.0-rc.1","prerelease":true},{"tag_name":"v0.3.0"}])");
    VersionResolver resolver(http, TestOptions());

    EXPECT_EQ(resolver.Resolve(std::nullopt).value_or(""), "v0.4.0-rc.1");
}

TEST(VersionResolverTest, PrereleasesCanBeExcluded) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200,
                 R"([{"tag_name":"v0.4.0-rc.1","prerelease":true},{"tag_name":"v0.3.0"}])");
    auto opt = TestOptions();
    opt.include_prereleases = false;
    VersionResolver resolver(http, opt);

    EXPECT_EQ(resolver.Resolve(std::nullopt).value_or(""), "v0.3.0");
}

TEST(VersionResolverTest, DraftsAreSkipped) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, R"([{"tag_name":"v9.9.9","draft":true},{"tag_name":"v0.3.0"}])");
    VersionResolver resolver(http, TestOptions());

    EXPECT_EQ(resolver.Resolve(std::nullopt).value_or(""), "v0.3.0");
}

TEST(VersionResolverTest, EmptyIndexFails) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, "[]");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_FALSE(tag.has_value());
    EXPECT_NE(tag.error().find("no releases found"), std::string::npos);
}

TEST(VersionResolverTest, MissingTagNameFails) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, R"([{"name":"untagged"}])");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_FALSE(tag.has_value());
    EXPECT_NE(tag.error().find("no tag_name"), std::string::npos);
}

TEST(VersionResolverTest, MalformedJsonFails) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, "{not json");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_FALSE(tag.has_value());
    EXPECT_NE(tag.error().find("failed to parse releases JSON"), std::string::npos);
}

TEST(VersionResolverTest, NonArrayRootFails) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 200, R"({"message":"rate limited"})");
    VersionResolver resolver(http, TestOptions());

    EXPECT_FALSE(resolver.Resolve(std::nullopt).has_value());
}

TEST(VersionResolverTest, HttpErrorStatusFails) {
    testutil::FakeHttpClient http;
    http.Respond(kReleasesUrl, 403, R"({"message":"API rate limit exceeded"})");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_FALSE(tag.has_value());
    EXPECT_NE(tag.error().find("HTTP 403"), std::string::npos);
}

TEST(VersionResolverTest, TransportErrorFails) {
    testutil::FakeHttpClient http;
    http.FailTransport(kReleasesUrl, "Could not resolve host");
    VersionResolver resolver(http, TestOptions());

    auto tag = resolver.Resolve(std::nullopt);
    ASSERT_FALSE(tag.has_value());
    EXPECT_NE(tag.error().find("failed to fetch releases"), std::string::npos);
    EXPECT_NE(tag.error().find("Could not resolve host"), std::string::npos);
}

} // namespace centy
