#include "rpc/http.h"

#include "core/logging.h"
#include "core/time.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <optional>

namespace rpc {

namespace {


std::string to_lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

std::string tls_error_string() {
    unsigned long err = ERR_get_error();
    if (err == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// Process-wide client context; peers are verified against the system
// trust store.
SSL_CTX* client_tls_context() {
    static std::once_flag once;
    static SSL_CTX* ctx = nullptr;
    std::call_once(once, [] {
        SSL_CTX* c = SSL_CTX_new(TLS_client_method());
        if (!c) {
            LOG_ERROR(core::LogCategory::HTTP,
                      "SSL_CTX_new failed: " + tls_error_string());
            return;
        }
        SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
        SSL_CTX_set_options(c, SSL_OP_IGNORE_UNEXPECTED_EOF);
        SSL_CTX_set_verify(c, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(c) != 1) {
            LOG_WARN(core::LogCategory::HTTP,
                     "could not load default CA locations: " +
                     tls_error_string());
        }
        ctx = c;
    });
    return ctx;
}

// ---------------------------------------------------------------------------
// Connection: non-blocking socket, optional TLS, shared deadline
// ---------------------------------------------------------------------------

class Connection {
public:
    explicit Connection(core::Deadline deadline) : deadline_(deadline) {}

    ~Connection() {
        if (ssl_) SSL_free(ssl_);
        if (fd_ >= 0) ::close(fd_);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    core::Result<void> open(const Url& url) {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;

        struct addrinfo* result = nullptr;
        const std::string port_str = std::to_string(url.port);
        int rc = getaddrinfo(url.host.c_str(), port_str.c_str(), &hints, &result);
        if (rc != 0) {
            return core::make_error(core::ErrorCode::NETWORK_ERROR,
                "cannot resolve " + url.host + ": " + gai_strerror(rc));
        }

        core::Error last(core::ErrorCode::NETWORK_ERROR,
                         "no usable address for " + url.host);
        for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
            auto res = connect_one(ai);
            if (res.ok()) {
                freeaddrinfo(result);
                return core::make_ok();
            }
            last = std::move(res).error();
            if (last.code() == core::ErrorCode::NETWORK_TIMEOUT) break;
        }
        freeaddrinfo(result);
        return last;
    }

    core::Result<void> start_tls(const std::string& host) {
        SSL_CTX* ctx = client_tls_context();
        if (!ctx) {
            return core::make_error(core::ErrorCode::NETWORK_TLS,
                                    "TLS context unavailable");
        }
        ssl_ = SSL_new(ctx);
        if (!ssl_ || SSL_set_fd(ssl_, fd_) != 1) {
            return core::make_error(core::ErrorCode::NETWORK_TLS,
                                    "SSL_new failed: " + tls_error_string());
        }

        if (is_ip_literal(host)) {
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), host.c_str());
        } else {
            SSL_set_tlsext_host_name(ssl_, host.c_str());
            SSL_set1_host(ssl_, host.c_str());
        }

        for (;;) {
            int rc = SSL_connect(ssl_);
            if (rc == 1) return core::make_ok();
            int err = SSL_get_error(ssl_, rc);
            if (err == SSL_ERROR_WANT_READ) {
                CHAINBOARD_TRY_VOID(wait_for(POLLIN));
            } else if (err == SSL_ERROR_WANT_WRITE) {
                CHAINBOARD_TRY_VOID(wait_for(POLLOUT));
            } else {
                std::string msg = "TLS handshake with " + host + " failed: ";
                long verify = SSL_get_verify_result(ssl_);
                if (verify != X509_V_OK) {
                    msg += X509_verify_cert_error_string(verify);
                    ERR_clear_error();
                } else {
                    msg += tls_error_string();
                }
                return core::make_error(core::ErrorCode::NETWORK_TLS, msg);
            }
        }
    }

    core::Result<void> send_all(std::string_view data) {
        size_t sent = 0;
        while (sent < data.size()) {
            const char* ptr = data.data() + sent;
            const size_t left = data.size() - sent;
            if (ssl_) {
                int rc = SSL_write(ssl_, ptr, static_cast<int>(left));
                if (rc > 0) {
                    sent += static_cast<size_t>(rc);
                    continue;
                }
                CHAINBOARD_TRY_VOID(handle_tls_retry(rc, "write"));
            } else {
                ssize_t n = ::send(fd_, ptr, left, MSG_NOSIGNAL);
                if (n > 0) {
                    sent += static_cast<size_t>(n);
                } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    CHAINBOARD_TRY_VOID(wait_for(POLLOUT));
                } else if (n < 0 && errno == EINTR) {
                    continue;
                } else {
                    return core::make_error(core::ErrorCode::NETWORK_CLOSED,
                        std::string("send failed: ") + std::strerror(errno));
                }
            }
        }
        return core::make_ok();
    }

    /// Returns the number of bytes read; 0 means the peer closed.
    core::Result<size_t> receive(char* buf, size_t len) {
        for (;;) {
            if (ssl_) {
                int rc = SSL_read(ssl_, buf, static_cast<int>(len));
                if (rc > 0) return static_cast<size_t>(rc);
                if (SSL_get_error(ssl_, rc) == SSL_ERROR_ZERO_RETURN) {
                    return size_t{0};
                }
                CHAINBOARD_TRY_VOID(handle_tls_retry(rc, "read"));
            } else {
                ssize_t n = ::recv(fd_, buf, len, 0);
                if (n >= 0) return static_cast<size_t>(n);
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    CHAINBOARD_TRY_VOID(wait_for(POLLIN));
                } else if (errno != EINTR) {
                    return core::make_error(core::ErrorCode::NETWORK_CLOSED,
                        std::string("recv failed: ") + std::strerror(errno));
                }
            }
        }
    }

private:
    core::Result<void> connect_one(const struct addrinfo* ai) {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        fd_ = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                       ai->ai_protocol);
        if (fd_ < 0) {
            return core::make_error(core::ErrorCode::NETWORK_ERROR,
                std::string("socket failed: ") + std::strerror(errno));
        }

        if (::connect(fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
            return core::make_ok();
        }
        if (errno != EINPROGRESS) {
            return connect_error(errno);
        }
        CHAINBOARD_TRY_VOID(wait_for(POLLOUT));

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
            return connect_error(errno);
        }
        if (so_error != 0) return connect_error(so_error);
        return core::make_ok();
    }

    static core::Error connect_error(int err) {
        auto code = (err == ECONNREFUSED) ? core::ErrorCode::NETWORK_REFUSED
                                          : core::ErrorCode::NETWORK_ERROR;
        return core::Error(code, std::string("connect failed: ") +
                                 std::strerror(err));
    }

    core::Result<void> handle_tls_retry(int rc, const char* op) {
        int err = SSL_get_error(ssl_, rc);
        if (err == SSL_ERROR_WANT_READ) return wait_for(POLLIN);
        if (err == SSL_ERROR_WANT_WRITE) return wait_for(POLLOUT);
        return core::make_error(core::ErrorCode::NETWORK_TLS,
            std::string("TLS ") + op + " failed: " + tls_error_string());
    }

    core::Result<void> wait_for(short events) {
        for (;;) {
            const auto remaining = deadline_.remaining();
            if (remaining.count() <= 0) {
                return core::make_error(core::ErrorCode::NETWORK_TIMEOUT,
                                        "request timed out");
            }
            struct pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = events;
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc > 0) return core::make_ok();
            if (rc == 0) {
                return core::make_error(core::ErrorCode::NETWORK_TIMEOUT,
                                        "request timed out");
            }
            if (errno != EINTR) {
                return core::make_error(core::ErrorCode::NETWORK_ERROR,
                    std::string("poll failed: ") + std::strerror(errno));
            }
        }
    }

    core::Deadline deadline_;
    int fd_ = -1;
    SSL* ssl_ = nullptr;
};

// ---------------------------------------------------------------------------
// Response framing
// ---------------------------------------------------------------------------

struct Head {
    int status = 0;
    std::map<std::string, std::string> headers;
    size_t body_offset = 0;
};

std::optional<Head> parse_head(std::string_view raw) {
    size_t end = raw.find("\r\n\r\n");
    if (end == std::string_view::npos) return std::nullopt;

    Head head;
    head.body_offset = end + 4;
    std::string_view block = raw.substr(0, end);

    size_t eol = block.find("\r\n");
    std::string_view status_line = block.substr(0, eol);
    if (status_line.substr(0, 5) != "HTTP/") return std::nullopt;
    size_t sp = status_line.find(' ');
    if (sp == std::string_view::npos || status_line.size() < sp + 4) {
        return std::nullopt;
    }
    int status = 0;
    for (size_t i = sp + 1; i < sp + 4; ++i) {
        char c = status_line[i];
        if (c < '0' || c > '9') return std::nullopt;
        status = status * 10 + (c - '0');
    }
    head.status = status;

    while (eol != std::string_view::npos) {
        block.remove_prefix(eol + 2);
        eol = block.find("\r\n");
        std::string_view line = block.substr(0, eol);
        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        head.headers[to_lower(trim(line.substr(0, colon)))] =
            std::string(trim(line.substr(colon + 1)));
    }
    return head;
}

bool is_chunked(const Head& head) {
    auto it = head.headers.find("transfer-encoding");
    return it != head.headers.end() &&
           to_lower(it->second).find("chunked") != std::string::npos;
}

std::optional<size_t> content_length(const Head& head) {
    auto it = head.headers.find("content-length");
    if (it == head.headers.end() || it->second.empty()) return std::nullopt;
    size_t len = 0;
    for (char c : it->second) {
        if (c < '0' || c > '9') return std::nullopt;
        len = len * 10 + static_cast<size_t>(c - '0');
    }
    return len;
}

// nullopt when the chunk stream is truncated or malformed.
std::optional<std::string> decode_chunked(std::string_view in) {
    std::string out;
    for (;;) {
        size_t eol = in.find("\r\n");
        if (eol == std::string_view::npos) return std::nullopt;
        std::string_view size_line = in.substr(0, eol);
        size_t semi = size_line.find(';');
        if (semi != std::string_view::npos) size_line = size_line.substr(0, semi);
        size_line = trim(size_line);
        if (size_line.empty() || size_line.size() > 15) return std::nullopt;

        size_t size = 0;
        for (char c : size_line) {
            int v;
            if (c >= '0' && c <= '9')      v = c - '0';
            else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
            else return std::nullopt;
            size = size * 16 + static_cast<size_t>(v);
        }
        in.remove_prefix(eol + 2);

        if (size == 0) return out;   // trailers are ignored
        if (in.size() < size + 2) return std::nullopt;
        out.append(in.data(), size);
        if (in.substr(size, 2) != "\r\n") return std::nullopt;
        in.remove_prefix(size + 2);
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Url
// ---------------------------------------------------------------------------

core::Result<Url> Url::parse(std::string_view text) {
    text = trim(text);
    size_t sep = text.find("://");
    if (sep == std::string_view::npos) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "URL has no scheme: " + std::string(text));
    }

    Url url;
    url.scheme = to_lower(text.substr(0, sep));
    if (url.scheme == "http") {
        url.port = 80;
    } else if (url.scheme == "https") {
        url.port = 443;
    } else {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "unsupported URL scheme: " + url.scheme);
    }

    std::string_view rest = text.substr(sep + 3);
    size_t auth_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, auth_end);
    if (auth_end != std::string_view::npos) {
        std::string_view target = rest.substr(auth_end);
        size_t frag = target.find('#');
        if (frag != std::string_view::npos) target = target.substr(0, frag);
        url.target = (target.empty() || target.front() != '/')
                         ? "/" + std::string(target)
                         : std::string(target);
    }

    if (authority.find('@') != std::string_view::npos) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "URL credentials are not supported");
    }

    std::string_view port_part;
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                    "unterminated IPv6 address in URL");
        }
        url.host = std::string(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                        "garbage after IPv6 address");
            }
            port_part = after.substr(1);
            has_port = true;
        }
    } else {
        size_t colon = authority.rfind(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_part = authority.substr(colon + 1);
            has_port = true;
        }
    }

    if (url.host.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "URL has no host: " + std::string(text));
    }

    if (has_port) {
        if (port_part.empty() || port_part.size() > 5) {
            return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                    "invalid URL port");
        }
        uint32_t port = 0;
        for (char c : port_part) {
            if (c < '0' || c > '9') {
                return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                        "invalid URL port");
            }
            port = port * 10 + static_cast<uint32_t>(c - '0');
        }
        if (port == 0 || port > 65535) {
            return core::make_error(core::ErrorCode::VALIDATION_RANGE,
                                    "URL port out of range");
        }
        url.port = static_cast<uint16_t>(port);
    }
    return url;
}

std::string Url::host_header() const {
    std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    const uint16_t default_port = tls() ? 443 : 80;
    if (port != default_port) h += ":" + std::to_string(port);
    return h;
}

std::string Url::redacted() const {
    std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    return scheme + "://" + h + ":" + std::to_string(port);
}

// ---------------------------------------------------------------------------
// Response parsing
// ---------------------------------------------------------------------------

bool http_response_complete(std::string_view raw) {
    auto head = parse_head(raw);
    if (!head) return false;
    std::string_view body = raw.substr(head->body_offset);
    if (is_chunked(*head)) return decode_chunked(body).has_value();
    if (auto len = content_length(*head)) return body.size() >= *len;
    return false;
}

core::Result<HttpResponse> parse_http_response(std::string_view raw) {
    auto head = parse_head(raw);
    if (!head) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "malformed or incomplete HTTP response head");
    }

    HttpResponse resp;
    resp.status = head->status;

    std::string_view body = raw.substr(head->body_offset);
    if (is_chunked(*head)) {
        auto decoded = decode_chunked(body);
        if (!decoded) {
            return core::make_error(core::ErrorCode::NETWORK_CLOSED,
                                    "truncated or malformed chunked body");
        }
        resp.body = std::move(*decoded);
    } else if (auto len = content_length(*head)) {
        if (body.size() < *len) {
            return core::make_error(core::ErrorCode::NETWORK_CLOSED,
                "truncated body: " + std::to_string(body.size()) + " of " +
                std::to_string(*len) + " bytes");
        }
        resp.body = std::string(body.substr(0, *len));
    } else {
        resp.body = std::string(body);
    }
    resp.headers = std::move(head->headers);
    return resp;
}

// ---------------------------------------------------------------------------
// HttpClient
// ---------------------------------------------------------------------------

core::Result<HttpResponse> HttpClient::post(
    const Url& url, std::string_view body,
    std::chrono::milliseconds timeout,
    std::string_view content_type) const {
    core::StopWatch watch;
    Connection conn{core::Deadline(timeout)};

    CHAINBOARD_TRY_VOID(conn.open(url));
    if (url.tls()) {
        CHAINBOARD_TRY_VOID(conn.start_tls(url.host));
    }

    std::string request;
    request.reserve(256 + body.size());
    request += "POST " + url.target + " HTTP/1.1\r\n";
    request += "Host: " + url.host_header() + "\r\n";
    request += "Content-Type: " + std::string(content_type) + "\r\n";
    request += "Accept: application/json\r\n";
    request += "User-Agent: chainboard\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request += body;

    CHAINBOARD_TRY_VOID(conn.send_all(request));

    std::string raw;
    char buf[4096];
    for (;;) {
        CHAINBOARD_TRY_ASSIGN(n, conn.receive(buf, sizeof(buf)));
        if (n == 0) break;
        raw.append(buf, n);
        if (http_response_complete(raw)) break;
    }

    if (raw.empty()) {
        return core::make_error(core::ErrorCode::NETWORK_CLOSED,
                                "connection closed without a response");
    }

    CHAINBOARD_TRY_ASSIGN(resp, parse_http_response(raw));
    LOG_TRACE(core::LogCategory::HTTP,
              "POST " + url.redacted() + " -> " + std::to_string(resp.status) +
              " (" + std::to_string(resp.body.size()) + " bytes, " +
              std::to_string(watch.elapsed_ms()) + " ms)");
    return resp;
}

} // namespace rpc
