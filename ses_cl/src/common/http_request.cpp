/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/http_request.hpp"
#include <strings.h> // strcasecmp

namespace ses {

void HttpRequest::set_header(const std::string& name, const std::string& value) {
    for (auto& kv : headers) {
        if (strcasecmp(kv.first.c_str(), name.c_str()) == 0) {
            kv.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpRequest::header(const std::string& name) const {
    for (const auto& kv : headers) {
        if (strcasecmp(kv.first.c_str(), name.c_str()) == 0) return kv.second;
    }
    return {};
}

} // namespace ses
