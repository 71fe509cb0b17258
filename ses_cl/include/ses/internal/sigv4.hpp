/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <utility>

namespace ses::internal {

// Building blocks of AWS Signature Version 4, exposed for testing.

// Canonical query string: pairs sorted by key then value, RFC 3986 encoded.
std::string canonical_query(const std::string& raw_query);

// Canonical URI: each path segment RFC 3986 encoded, "/" when empty.
std::string canonical_uri(const std::string& path);

// headers: (name, value) pairs that are to be signed. Names are lowercased,
// values trimmed with inner whitespace runs collapsed, then sorted.
// signed_headers receives "a;b;c".
std::string canonical_request(const std::string& method,
                              const std::string& path,
                              const std::string& raw_query,
                              const std::vector<std::pair<std::string, std::string>>& headers,
                              const std::string& payload,
                              std::string& signed_headers);

// "<YYYYMMDD>/<region>/<service>/aws4_request"
std::string credential_scope(const std::string& day,
                             const std::string& region,
                             const std::string& service);

// "AWS4-HMAC-SHA256\n<amz_date>\n<scope>\n<hex sha256(canonical)>"
std::string string_to_sign(const std::string& amz_date,
                           const std::string& scope,
                           const std::string& canonical);

// HMAC chain "AWS4"+secret -> day -> region -> service -> "aws4_request".
bool derive_signing_key(const std::string& secret,
                        const std::string& day,
                        const std::string& region,
                        const std::string& service,
                        std::string& out_key_bin);

} // namespace ses::internal
