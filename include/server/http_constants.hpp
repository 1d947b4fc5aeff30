#pragma once

#include <string>
#include <string_view>

namespace gatekeeper::http {

// std::string where cpp-httplib APIs require const std::string&
inline const std::string kOriginHeader = "Origin";
inline const std::string kUserAgentHeader = "User-Agent";
inline const std::string kRequestIdHeader = "X-Request-ID";
inline const std::string kForwardedForHeader = "X-Forwarded-For";
inline const std::string kForwardedProtoHeader = "X-Forwarded-Proto";

inline constexpr std::string_view kVary = "Vary";
inline constexpr std::string_view kAllowOrigin = "Access-Control-Allow-Origin";
inline constexpr std::string_view kAllowCredentials = "Access-Control-Allow-Credentials";
inline constexpr std::string_view kAllowMethods = "Access-Control-Allow-Methods";
inline constexpr std::string_view kAllowHeaders = "Access-Control-Allow-Headers";
inline constexpr std::string_view kMaxAge = "Access-Control-Max-Age";

inline constexpr std::string_view kContentTypeOptions = "X-Content-Type-Options";
inline constexpr std::string_view kFrameOptions = "X-Frame-Options";
inline constexpr std::string_view kXssProtection = "X-XSS-Protection";
inline constexpr std::string_view kReferrerPolicy = "Referrer-Policy";
inline constexpr std::string_view kPermissionsPolicy = "Permissions-Policy";
inline constexpr std::string_view kContentSecurityPolicy = "Content-Security-Policy";
inline constexpr std::string_view kStrictTransportSecurity = "Strict-Transport-Security";

inline constexpr std::string_view kPreflightMethod = "OPTIONS";
inline constexpr const char* kJsonContentType = "application/json";

} // namespace gatekeeper::http
