/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/transport.hpp"
#include "ses/log.hpp"

#include "ses/internal/http_low.hpp"
#include "ses/internal/tls_cli_ctx.hpp"
#include "ses/internal/url.hpp"
#include "ses/internal/utils.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <poll.h>
#include <cerrno>
#include <fcntl.h>
#include <strings.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>

namespace {

constexpr std::size_t kMaxHead = 1u << 20;
constexpr std::size_t kMaxBody = 64u << 20;

// Returns remaining milliseconds until deadline, clamped to [0, INT_MAX].
[[nodiscard]] inline int remaining_ms(std::chrono::steady_clock::time_point deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 0;
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

// Drains the OpenSSL error stack into one string.
std::string openssl_errors() {
    std::string out;
    unsigned long e = 0;
    while ((e = ::ERR_get_error()) != 0) {
        char buf[256];
        ::ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out;
}

// TLS handshake on a non-blocking socket, bounded by timeout_sec.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, int timeout_sec, std::string& err) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::max(1, timeout_sec));

    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) return true;

        const int ssl_err = ::SSL_get_error(ssl, rc);
        short ev = 0;
        if (ssl_err == SSL_ERROR_WANT_READ) ev = POLLIN;
        else if (ssl_err == SSL_ERROR_WANT_WRITE) ev = POLLOUT;
        else if (ssl_err == SSL_ERROR_SYSCALL && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) ev = POLLIN;

        if (ev == 0) {
            if (ssl_err == SSL_ERROR_SYSCALL && errno != 0) {
                err = std::string("SSL_connect: ") + std::strerror(errno);
            } else {
                const std::string detail = openssl_errors();
                err = "SSL_connect failed (ssl_error=" + std::to_string(ssl_err) + ")" +
                      (detail.empty() ? "" : ": " + detail);
            }
            return false;
        }

        const int ms = remaining_ms(deadline);
        if (ms <= 0) {
            err = "SSL_connect timeout";
            return false;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = ev;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, ms);
        } while (pr < 0 && errno == EINTR);
        if (pr <= 0) {
            err = "SSL_connect timeout";
            return false;
        }
    }
}

void free_ssl(SSL* s) {
    if (!s) return;
    if (SSL_is_init_finished(s)) (void)SSL_shutdown(s);
    SSL_free(s);
}

using SslPtr = std::unique_ptr<SSL, void(*)(SSL*)>;

// One request/response exchange on an open connection (plain or TLS).
class Stream {
public:
    Stream(ses::internal::TcpConn& tcp, SSL* ssl) : _tcp(tcp), _ssl(ssl) {}

    bool write_all(const std::string& data) {
        if (!_ssl) return _tcp.send_all(data.data(), data.size());
        std::size_t off = 0;
        while (off < data.size()) {
            const int chunk = (int)std::min<std::size_t>(data.size() - off, 1u << 30);
            const int n = SSL_write(_ssl, data.data() + off, chunk);
            if (n <= 0) { (void)SSL_get_error(_ssl, n); return false; }
            off += (std::size_t)n;
        }
        return true;
    }

    // Bytes read, 0 on orderly EOF, -1 on error.
    long read_some(char* buf, std::size_t len) {
        if (!_ssl) return _tcp.recv_some(buf, len);
        const int n = SSL_read(_ssl, buf, (int)len);
        if (n > 0) return n;
        const int e = SSL_get_error(_ssl, n);
        if (e == SSL_ERROR_ZERO_RETURN) return 0;
        return -1;
    }

private:
    ses::internal::TcpConn& _tcp;
    SSL* _ssl;
};

} // namespace

namespace ses {

struct HttpTransport::Impl {
    ClientConfig cfg;
    std::unique_ptr<internal::TlsClientContext> tls;

    explicit Impl(const ClientConfig& c) : cfg(c) {
        tls = std::make_unique<internal::TlsClientContext>(cfg);
    }

    bool open_tls(internal::TcpConn& tcp, const internal::Url& url, SslPtr& ssl, std::string& err) {
        if (!tls || !tls->ctx()) {
            err = "TLS context not ready";
            return false;
        }
        SSL* s = SSL_new(tls->ctx());
        if (!s) {
            err = "SSL_new failed: " + openssl_errors();
            return false;
        }
        ssl.reset(s);
        SSL_set_fd(s, tcp.fd());

        unsigned char tmp[16];
        const bool is_ip = (::inet_pton(AF_INET, url.host.c_str(), tmp) == 1) ||
                           (::inet_pton(AF_INET6, url.host.c_str(), tmp) == 1);
        if (!is_ip) SSL_set_tlsext_host_name(s, url.host.c_str());

        // Chain validation alone does not check the name.
        if (cfg.tls_verify_peer) {
            if (is_ip) {
                X509_VERIFY_PARAM* param = SSL_get0_param(s);
                if (!param || X509_VERIFY_PARAM_set1_ip_asc(param, url.host.c_str()) != 1) {
                    err = "X509_VERIFY_PARAM_set1_ip_asc failed";
                    return false;
                }
            } else if (SSL_set1_host(s, url.host.c_str()) != 1) {
                err = "SSL_set1_host failed";
                return false;
            }
        }

        const int fd = tcp.fd();
        const int old_flags = ::fcntl(fd, F_GETFL, 0);
        if (old_flags < 0 || ::fcntl(fd, F_SETFL, old_flags | O_NONBLOCK) < 0) {
            err = std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno);
            return false;
        }
        const bool hs_ok = ssl_connect_with_deadline(s, fd, std::max(5, cfg.connect_timeout_sec), err);
        (void)::fcntl(fd, F_SETFL, old_flags);
        if (!hs_ok) return false;

        if (cfg.tls_verify_peer) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                err = std::string("TLS verify failed: ") + X509_verify_cert_error_string(vr);
                return false;
            }
        }
        return true;
    }

    static std::string request_head(const HttpRequest& req, const internal::Url& url) {
        std::ostringstream h;
        h << internal::upper_copy(req.method) << ' ' << url.path;
        if (!url.query.empty()) h << '?' << url.query;
        h << " HTTP/1.1\r\n";
        h << "Host: " << internal::host_header(url) << "\r\n";
        h << "User-Agent: ses-client/1\r\n";
        h << "Accept: */*\r\n";
        for (const auto& kv : req.headers) {
            if (strcasecmp(kv.first.c_str(), "Host") == 0 ||
                strcasecmp(kv.first.c_str(), "Content-Length") == 0 ||
                strcasecmp(kv.first.c_str(), "Connection") == 0) {
                continue;
            }
            h << kv.first << ": " << kv.second << "\r\n";
        }
        h << "Content-Length: " << req.body.size() << "\r\n";
        h << "Connection: close\r\n";
        h << "\r\n";
        return h.str();
    }

    static bool read_response(Stream& io, HttpResponse& out, std::string& err) {
        std::string buf;
        char chunk[4096];

        while (buf.find("\r\n\r\n") == std::string::npos) {
            const long n = io.read_some(chunk, sizeof(chunk));
            if (n <= 0) {
                err = (n == 0) ? "connection closed before response headers"
                               : std::string("read failed: ") + std::strerror(errno);
                return false;
            }
            buf.append(chunk, (std::size_t)n);
            if (buf.size() > kMaxHead) {
                err = "response headers too large";
                return false;
            }
        }

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(buf, hdr_end_off, out.status_code, out.status_text, out.headers)) {
            err = "malformed HTTP response";
            return false;
        }
        std::string rest = buf.substr(hdr_end_off);

        const std::string te = internal::lower_copy(internal::hdr_ci(out.headers, "Transfer-Encoding"));
        const std::string cl = internal::hdr_ci(out.headers, "Content-Length");

        if (te.find("chunked") != std::string::npos) {
            for (;;) {
                bool complete = false;
                if (internal::decode_chunked(rest, out.body, complete)) return true;
                if (complete) return body_failed(out, "malformed chunked body", err);
                const long n = io.read_some(chunk, sizeof(chunk));
                if (n <= 0) return body_failed(out, "connection closed inside chunked body", err);
                rest.append(chunk, (std::size_t)n);
                if (rest.size() > kMaxBody) return body_failed(out, "response body too large", err);
            }
        }

        if (!cl.empty()) {
            std::size_t content_len = 0;
            try {
                content_len = (std::size_t)std::stoull(cl);
            } catch (const std::exception&) {
                out.body.swap(rest);
                return body_failed(out, "bad Content-Length: " + cl, err);
            }
            if (content_len > kMaxBody) return body_failed(out, "response body too large", err);
            out.body.assign(rest, 0, std::min(rest.size(), content_len));
            while (out.body.size() < content_len) {
                const std::size_t need = content_len - out.body.size();
                const long n = io.read_some(chunk, std::min(sizeof(chunk), need));
                if (n <= 0) {
                    return body_failed(out, "connection closed after " + std::to_string(out.body.size()) +
                                            " of " + std::to_string(content_len) + " body bytes", err);
                }
                out.body.append(chunk, (std::size_t)n);
            }
            return true;
        }

        // No framing: body runs to EOF ("Connection: close").
        out.body.swap(rest);
        for (;;) {
            const long n = io.read_some(chunk, sizeof(chunk));
            if (n == 0) return true;
            if (n < 0) return body_failed(out, std::string("read failed: ") + std::strerror(errno), err);
            out.body.append(chunk, (std::size_t)n);
            if (out.body.size() > kMaxBody) return body_failed(out, "response body too large", err);
        }
    }

    // The status line and headers arrived but the body did not. A 200 without
    // its full body is a failed call. Any other status is still the server's
    // answer, so it is returned with whatever part of the body arrived.
    static bool body_failed(const HttpResponse& out, const std::string& what, std::string& err) {
        if (out.status_code == 200) {
            err = what;
            return false;
        }
        ses::log_line("[HTTP] status " + std::to_string(out.status_code) + ", partial body (" +
                      std::to_string(out.body.size()) + " bytes): " + what);
        return true;
    }
};

HttpTransport::HttpTransport(const ClientConfig& cfg)
    : _p(std::make_unique<HttpTransport::Impl>(cfg)) {}

HttpTransport::~HttpTransport() = default;

bool HttpTransport::send(const HttpRequest& req, HttpResponse& out, std::string& err) {
    out = HttpResponse{};

    internal::Url url;
    if (!internal::parse_url(req.url, url, err)) return false;

    // Declaration order matters: the SSL session is shut down before the socket closes.
    internal::TcpConn tcp;
    SslPtr ssl{nullptr, free_ssl};

    if (!tcp.open(url.host, url.port, _p->cfg.connect_timeout_sec, _p->cfg.io_timeout_sec, err)) {
        return false;
    }
    if (url.scheme == "https" && !_p->open_tls(tcp, url, ssl, err)) {
        ses::log_line("[TLS-CLI] " + url.host + ": " + err);
        return false;
    }

    Stream io(tcp, ssl.get());
    if (!io.write_all(Impl::request_head(req, url)) || (!req.body.empty() && !io.write_all(req.body))) {
        err = "failed to write request to " + internal::host_header(url);
        ses::log_line("[HTTP] " + err);
        return false;
    }
    if (!Impl::read_response(io, out, err)) {
        ses::log_line("[HTTP] " + internal::host_header(url) + ": " + err);
        return false;
    }
    return true;
}

} // namespace ses
