// SPDX-License-Identifier: Apache-2.0
// Part of the SESmail project.
// ses_cl/src/client/http_low.cpp

#include "ses/internal/http_low.hpp"
#include "ses/log.hpp"
#include "ses/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <algorithm>
#include <strings.h> // strcasecmp

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace ses::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   int connect_timeout_sec, int io_timeout_sec, std::string& err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = std::string("getaddrinfo(") + host + ") failed: " + gai_strerror(rc);
        ses::log_line("[TCP] " + err);
        return false;
    }

    const int connect_timeout_ms = std::max(1, connect_timeout_sec) * 1000;

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        // Switch to non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;

            int pr = 0;
            do {
                pr = ::poll(&pfd, 1, connect_timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr <= 0 || !(pfd.revents & (POLLOUT | POLLERR | POLLHUP))) {
                last_errno = (pr == 0) ? ETIMEDOUT : errno;
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        // Back to blocking mode for normal I/O (SO_*TIMEO will work)
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{std::max(1, io_timeout_sec), 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        err = "connect to " + host + ":" + std::to_string(port) + " failed: " +
              (last_errno ? std::strerror(last_errno) : "no usable address");
        ses::log_line("[TCP] " + err);
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

long TcpConn::recv_some(char* d, std::size_t len) {
    for (;;) {
        ssize_t n = ::recv(_fd, d, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return (long)n;
    }
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.compare(0, 5, "HTTP/") != 0) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[k] = v;
        }
    }
    return true;
}

bool decode_chunked(const std::string& in, std::string& out, bool& complete) {
    out.clear();
    complete = false;
    std::size_t pos = 0;
    for (;;) {
        const std::size_t eol = in.find("\r\n", pos);
        if (eol == std::string::npos) return false;
        std::string size_line = in.substr(pos, eol - pos);
        const std::size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.erase(ext);
        trim_inplace(size_line);
        if (size_line.empty()) return false;

        std::size_t n = 0;
        for (char c : size_line) {
            const int v = hexval(c);
            if (v < 0 || n > (std::size_t(1) << 40)) {
                complete = true; // malformed, more data will not help
                return false;
            }
            n = n * 16 + (std::size_t)v;
        }
        pos = eol + 2;
        if (n == 0) {
            complete = true;
            return true;
        }
        if (in.size() < pos + n + 2) return false;
        out.append(in, pos, n);
        pos += n;
        if (in.compare(pos, 2, "\r\n") != 0) {
            complete = true;
            return false;
        }
        pos += 2;
    }
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace ses::internal
