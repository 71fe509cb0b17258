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
#include <utility>
#include <vector>

namespace ses {

// Outgoing HTTP request as handed to a Transport. Headers keep insertion order.
struct HttpRequest {
    std::string method;   // "POST"
    std::string url;      // "https://email.us-east-1.amazonaws.com/"
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    // Replaces an existing header (case-insensitive) or appends a new one.
    void set_header(const std::string& name, const std::string& value);
    // Empty string when absent.
    std::string header(const std::string& name) const;
};

} // namespace ses
