/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/sigv4.hpp"
#include "ses/internal/hmac.hpp"
#include "ses/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace ses::internal {
namespace {

// Trim, then collapse inner whitespace runs to one space.
std::string canonical_header_value(const std::string& v) {
    std::string out; out.reserve(v.size());
    bool in_space = false;
    for (unsigned char c : v) {
        if (std::isspace(c)) { in_space = true; continue; }
        if (in_space && !out.empty()) out.push_back(' ');
        in_space = false;
        out.push_back((char)c);
    }
    return out;
}

} // namespace

std::string canonical_query(const std::string& raw_query) {
    std::vector<std::pair<std::string, std::string>> v;
    std::size_t p = 0;
    while (p < raw_query.size()) {
        std::size_t amp = raw_query.find('&', p);
        if (amp == std::string::npos) amp = raw_query.size();
        const std::string part = raw_query.substr(p, amp - p);
        if (!part.empty()) {
            const std::size_t eq = part.find('=');
            std::string k = url_unescape(part.substr(0, eq));
            std::string val = (eq == std::string::npos) ? std::string() : url_unescape(part.substr(eq + 1));
            v.emplace_back(uri_encode(k), uri_encode(val));
        }
        p = amp + 1;
    }
    std::sort(v.begin(), v.end());

    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : v) {
        if (!first) oss << '&';
        first = false;
        oss << kv.first << '=' << kv.second;
    }
    return oss.str();
}

std::string canonical_uri(const std::string& path) {
    if (path.empty()) return "/";
    return uri_encode(path, /*keep_slash=*/true);
}

std::string canonical_request(const std::string& method,
                              const std::string& path,
                              const std::string& raw_query,
                              const std::vector<std::pair<std::string, std::string>>& headers,
                              const std::string& payload,
                              std::string& signed_headers)
{
    std::vector<std::pair<std::string, std::string>> hs;
    hs.reserve(headers.size());
    for (const auto& kv : headers) {
        hs.emplace_back(lower_copy(kv.first), canonical_header_value(kv.second));
    }
    std::sort(hs.begin(), hs.end(),
              [](const auto& a, const auto& b){ return a.first < b.first; });

    std::ostringstream can_hdrs;
    signed_headers.clear();
    for (std::size_t i = 0; i < hs.size(); ++i) {
        can_hdrs << hs[i].first << ':' << hs[i].second << '\n';
        if (i) signed_headers += ';';
        signed_headers += hs[i].first;
    }

    std::ostringstream oss;
    oss << upper_copy(method) << '\n'
        << canonical_uri(path) << '\n'
        << canonical_query(raw_query) << '\n'
        << can_hdrs.str() << '\n'
        << signed_headers << '\n'
        << sha256_hex(payload);
    return oss.str();
}

std::string credential_scope(const std::string& day,
                             const std::string& region,
                             const std::string& service) {
    return day + "/" + region + "/" + service + "/aws4_request";
}

std::string string_to_sign(const std::string& amz_date,
                           const std::string& scope,
                           const std::string& canonical) {
    return "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" + sha256_hex(canonical);
}

bool derive_signing_key(const std::string& secret,
                        const std::string& day,
                        const std::string& region,
                        const std::string& service,
                        std::string& out_key_bin)
{
    std::string k_secret = "AWS4" + secret;
    std::string k_date, k_region, k_service;
    const bool ok = hmac_sha256_bin(k_secret, day, k_date)
                 && hmac_sha256_bin(k_date, region, k_region)
                 && hmac_sha256_bin(k_region, service, k_service)
                 && hmac_sha256_bin(k_service, "aws4_request", out_key_bin);
    secure_wipe(k_secret);
    secure_wipe(k_date);
    secure_wipe(k_region);
    secure_wipe(k_service);
    return ok;
}

} // namespace ses::internal
