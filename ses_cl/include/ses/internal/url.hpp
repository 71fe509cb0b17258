/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>

namespace ses::internal {

// Absolute http(s) URL split into the parts the signer and transport need.
struct Url {
    std::string   scheme;     // "http" | "https" (lowercase)
    std::string   host;       // without brackets for IPv6 literals
    std::uint16_t port = 0;   // explicit or scheme default
    bool          explicit_port = false;
    std::string   path;       // "/" when empty
    std::string   query;      // without '?'
};

bool parse_url(const std::string& s, Url& out, std::string& err);

// Value of the Host header: host, plus ":port" when not the scheme default.
std::string host_header(const Url& u);

} // namespace ses::internal
