/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <ctime>
#include <string>
#include "ses/client_config.hpp"
#include "ses/http_request.hpp"

namespace ses {

// Service identifier in the SigV4 credential scope.
inline constexpr const char* kSesService = "email";

// Signs req in place at UNIX time `now` using cfg.scheme.
//
// SigV4: sets Date and X-Amz-Date, then Authorization
//   "AWS4-HMAC-SHA256 Credential=<id>/<date>/<region>/email/aws4_request,
//    SignedHeaders=content-type;date;host;x-amz-date, Signature=<hex>".
// Aws3Https: sets Date, then X-Amzn-Authorization
//   "AWS3-HTTPS AWSAccessKeyId=<id>, Algorithm=HmacSHA256, Signature=<base64>".
//
// req.url must be an absolute http(s) URL and Content-Type must already be set.
bool sign_request(HttpRequest& req, const ClientConfig& cfg, std::time_t now, std::string& err);

} // namespace ses
