#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gatekeeper {

// ============================================================================
// Request Types
// ============================================================================

enum class Scheme {
    HTTP,
    HTTPS
};

/**
 * @brief Read-only view of one inbound request
 *
 * Built once per request by the transport adapter; lives for that request only.
 * Absent headers stay std::nullopt (consumers substitute their own defaults).
 */
struct RequestContext {
    std::string request_id;                      // Echoed as X-Request-ID (empty = none)
    std::string method;
    Scheme scheme = Scheme::HTTP;
    std::string path;
    std::optional<std::string> origin;           // Origin header
    std::optional<std::string> client_address;   // Transport peer (or trusted X-Forwarded-For)
    std::optional<std::string> client_identity;  // User-Agent header
};

// ============================================================================
// Response Types
// ============================================================================

/// Header-name ordering per RFC 9110 (field names are case-insensitive).
struct CaseInsensitiveLess {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const auto ca = static_cast<unsigned char>(a[i]);
            const auto cb = static_cast<unsigned char>(b[i]);
            const int la = (ca >= 'A' && ca <= 'Z') ? ca + 32 : ca;
            const int lb = (cb >= 'A' && cb <= 'Z') ? cb + 32 : cb;
            if (la != lb) return la < lb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

struct GatewayResponse {
    int status = 200;
    std::string body;
    std::string content_type;
    HeaderMap headers;

    /// Set (or replace) a header
    void set_header(std::string_view name, std::string_view value) {
        if (const auto it = headers.find(name); it != headers.end()) {
            it->second = std::string(value);
        } else {
            headers.emplace(std::string(name), std::string(value));
        }
    }

    [[nodiscard]] bool has_header(std::string_view name) const {
        return headers.find(name) != headers.end();
    }

    [[nodiscard]] std::string header_value(std::string_view name) const {
        const auto it = headers.find(name);
        return it != headers.end() ? it->second : std::string{};
    }
};

/// Downstream application handler
using Handler = std::function<GatewayResponse(const RequestContext&)>;

} // namespace gatekeeper
