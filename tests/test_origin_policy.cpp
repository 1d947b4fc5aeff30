#include <catch2/catch_test_macros.hpp>
#include "security/origin_policy.hpp"

using namespace gatekeeper;

TEST_CASE("OriginPolicy: empty or absent origin is never allowed", "[origin]") {
    const OriginAllowList list = {"https://app.example.com", "*.example.com", ""};
    CHECK_FALSE(OriginPolicy::is_allowed("", list));
    CHECK_FALSE(OriginPolicy::is_allowed(std::nullopt, list));
    CHECK_FALSE(OriginPolicy::is_allowed("", OriginAllowList{}));
}

TEST_CASE("OriginPolicy: exact entries", "[origin]") {
    const OriginAllowList list = {"http://localhost:3000", "https://app.example.com"};
    CHECK(OriginPolicy::is_allowed("http://localhost:3000", list));
    CHECK(OriginPolicy::is_allowed("https://app.example.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("http://localhost:3001", list));
    CHECK_FALSE(OriginPolicy::is_allowed("http://app.example.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://app.example.com.evil.com", list));
}

TEST_CASE("OriginPolicy: suffix wildcard matches subdomains", "[origin][wildcard]") {
    const OriginAllowList list = {"*.example.com"};
    CHECK(OriginPolicy::is_allowed("https://app.example.com", list));
    CHECK(OriginPolicy::is_allowed("http://deep.api.example.com", list));
    CHECK(OriginPolicy::is_allowed("https://example.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://evil.com", list));
}

TEST_CASE("OriginPolicy: wildcard requires a label boundary", "[origin][wildcard]") {
    const OriginAllowList list = {"*.example.com"};
    CHECK_FALSE(OriginPolicy::is_allowed("https://notexample.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://evilexample.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("notexample.com", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://example.com.evil.net", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://app.example.com:8443", list));
}

TEST_CASE("OriginPolicy: scheme-qualified wildcard", "[origin][wildcard]") {
    const OriginAllowList list = {"https://*.vercel.app"};
    CHECK(OriginPolicy::is_allowed("https://my-app.vercel.app", list));
    CHECK_FALSE(OriginPolicy::is_allowed("http://my-app.vercel.app", list));
    CHECK_FALSE(OriginPolicy::is_allowed("https://myvercel.app", list));
}

TEST_CASE("OriginPolicy: degenerate wildcard entries never match", "[origin][wildcard]") {
    CHECK_FALSE(OriginPolicy::is_allowed("https://example.com", OriginAllowList{"*."}));
    CHECK_FALSE(OriginPolicy::matches_wildcard("https://example.com", "example.com"));
    CHECK(OriginPolicy::is_wildcard("*.example.com"));
    CHECK(OriginPolicy::is_wildcard("https://*.example.com"));
    CHECK_FALSE(OriginPolicy::is_wildcard("https://example.com"));
}

TEST_CASE("OriginPolicy: instance uses its configured list", "[origin]") {
    const OriginPolicy policy({"https://a.test", "*.b.test"});
    CHECK(policy.is_allowed("https://a.test"));
    CHECK(policy.is_allowed("https://x.b.test"));
    CHECK_FALSE(policy.is_allowed("https://c.test"));
    CHECK(policy.allow_list().size() == 2);
}
