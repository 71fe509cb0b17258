/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/url.hpp"
#include "ses/internal/utils.hpp"
#include <cctype>

namespace ses::internal {

bool parse_url(const std::string& s, Url& out, std::string& err) {
    out = Url{};
    const std::size_t sep = s.find("://");
    if (sep == std::string::npos || sep == 0) {
        err = "endpoint URL has no scheme: '" + s + "'";
        return false;
    }
    out.scheme = lower_copy(s.substr(0, sep));
    if (out.scheme != "http" && out.scheme != "https") {
        err = "unsupported URL scheme '" + out.scheme + "'";
        return false;
    }

    std::string rest = s.substr(sep + 3);
    const std::size_t frag = rest.find('#');
    if (frag != std::string::npos) rest.erase(frag);

    std::size_t auth_end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, auth_end);
    std::string tail = (auth_end == std::string::npos) ? std::string() : rest.substr(auth_end);

    const std::size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    std::string port_s;
    if (!authority.empty() && authority[0] == '[') {
        const std::size_t close = authority.find(']');
        if (close == std::string::npos) {
            err = "unterminated IPv6 literal in '" + s + "'";
            return false;
        }
        out.host = authority.substr(1, close - 1);
        const std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                err = "garbage after IPv6 literal in '" + s + "'";
                return false;
            }
            port_s = after.substr(1);
        }
    } else {
        const std::size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_s = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }
    if (out.host.empty()) {
        err = "endpoint URL has no host: '" + s + "'";
        return false;
    }

    out.port = (out.scheme == "https") ? 443 : 80;
    if (!port_s.empty()) {
        unsigned long p = 0;
        for (char c : port_s) {
            if (!std::isdigit((unsigned char)c) || p > 65535) { p = 0; break; }
            p = p * 10 + (unsigned long)(c - '0');
        }
        if (p == 0 || p > 65535) {
            err = "invalid port '" + port_s + "'";
            return false;
        }
        out.port = (std::uint16_t)p;
        out.explicit_port = true;
    }

    const std::size_t q = tail.find('?');
    if (q != std::string::npos) {
        out.query = tail.substr(q + 1);
        tail.erase(q);
    }
    out.path = tail.empty() ? "/" : tail;
    return true;
}

std::string host_header(const Url& u) {
    std::string h = (u.host.find(':') != std::string::npos) ? "[" + u.host + "]" : u.host;
    const std::uint16_t def = (u.scheme == "https") ? 443 : 80;
    if (u.port != def) h += ":" + std::to_string(u.port);
    return h;
}

} // namespace ses::internal
