#pragma once

#include "core/error.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// Url
// ---------------------------------------------------------------------------

/// Parsed http:// or https:// URL. The target keeps the path and query
/// ("/" when the URL has none).
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;
    uint16_t    port = 0;
    std::string target = "/";

    [[nodiscard]] bool tls() const { return scheme == "https"; }

    /// "host" when the port is the scheme default, "host:port" otherwise.
    [[nodiscard]] std::string host_header() const;

    /// Scheme, host and port only. Used in log lines so that API keys
    /// embedded in the path never reach the log.
    [[nodiscard]] std::string redacted() const;

    static core::Result<Url> parse(std::string_view text);
};

// ---------------------------------------------------------------------------
// HttpResponse
// ---------------------------------------------------------------------------

struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;   // lower-cased names
    std::string body;

    [[nodiscard]] bool is_success() const { return status >= 200 && status < 300; }
};

/// Parse a complete HTTP/1.1 response (status line, headers and a body
/// delimited by Content-Length, chunked encoding or end of stream).
core::Result<HttpResponse> parse_http_response(std::string_view raw);

/// True once @p raw holds a full response according to its framing
/// headers. Responses without framing are complete only at end of stream.
bool http_response_complete(std::string_view raw);

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------

/// One-shot HTTP/1.1 POST client. Every request opens a fresh connection
/// with "Connection: close". The timeout bounds the whole exchange
/// (resolve excluded): connect, TLS handshake, send and receive.
class HttpClient {
public:
    HttpClient() = default;

    /// POST @p body to @p url. Expiry of @p timeout yields NETWORK_TIMEOUT,
    /// connection failures NETWORK_REFUSED/NETWORK_ERROR, TLS failures
    /// NETWORK_TLS. Any status is returned as-is; callers decide what a
    /// non-2xx status means.
    core::Result<HttpResponse> post(const Url& url, std::string_view body,
                                    std::chrono::milliseconds timeout,
                                    std::string_view content_type =
                                        "application/json") const;
};

} // namespace rpc
