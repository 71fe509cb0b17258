/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/signer.hpp"
#include "ses/log.hpp"

#include "ses/internal/hmac.hpp"
#include "ses/internal/sigv4.hpp"
#include "ses/internal/time.hpp"
#include "ses/internal/url.hpp"
#include "ses/internal/utils.hpp"

#include <sstream>

namespace ses {
namespace {

bool sign_v4(HttpRequest& req, const ClientConfig& cfg, std::time_t now,
             const internal::Url& url, std::string& err)
{
    const std::string xdate = internal::amz_date(now);
    const std::string day   = internal::amz_day(now);
    req.set_header("X-Amz-Date", xdate);

    const std::vector<std::pair<std::string, std::string>> to_sign = {
        {"Content-Type", req.header("Content-Type")},
        {"Date",         req.header("Date")},
        {"Host",         internal::host_header(url)},
        {"X-Amz-Date",   xdate},
    };

    std::string signed_headers;
    const std::string canonical = internal::canonical_request(
        req.method, url.path, url.query, to_sign, req.body, signed_headers);
    const std::string scope = internal::credential_scope(day, cfg.creds.region, kSesService);
    const std::string sts = internal::string_to_sign(xdate, scope, canonical);

    std::string key_bin;
    if (!internal::derive_signing_key(cfg.creds.secret_access_key, day, cfg.creds.region,
                                      kSesService, key_bin)) {
        err = "SigV4 signing key derivation failed";
        return false;
    }
    std::string mac_bin;
    const bool ok = internal::hmac_sha256_bin(key_bin, sts, mac_bin);
    internal::secure_wipe(key_bin);
    if (!ok) {
        err = "SigV4 signature HMAC failed";
        return false;
    }
    const std::string sig_hex =
        internal::bytes_to_hex((const unsigned char*)mac_bin.data(), mac_bin.size());

    std::ostringstream auth;
    auth << "AWS4-HMAC-SHA256 Credential=" << cfg.creds.access_key_id << '/' << scope
         << ", SignedHeaders=" << signed_headers
         << ", Signature=" << sig_hex;
    req.set_header("Authorization", auth.str());
    return true;
}

bool sign_v3(HttpRequest& req, const ClientConfig& cfg, std::string& err) {
    std::string mac_bin;
    if (!internal::hmac_sha256_bin(cfg.creds.secret_access_key, req.header("Date"), mac_bin)) {
        err = "AWS3 signature HMAC failed";
        return false;
    }
    std::ostringstream auth;
    auth << "AWS3-HTTPS AWSAccessKeyId=" << cfg.creds.access_key_id
         << ", Algorithm=HmacSHA256, Signature=" << internal::base64_encode(mac_bin);
    req.set_header("X-Amzn-Authorization", auth.str());
    return true;
}

} // namespace

bool sign_request(HttpRequest& req, const ClientConfig& cfg, std::time_t now, std::string& err) {
    internal::Url url;
    if (!internal::parse_url(req.url, url, err)) return false;

    req.set_header("Date", internal::http_date(now));

    const bool ok = (cfg.scheme == SignScheme::SigV4)
                  ? sign_v4(req, cfg, now, url, err)
                  : sign_v3(req, cfg, err);
    if (!ok) ses::log_line("[SIGN] " + err);
    return ok;
}

} // namespace ses
