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
#include <unordered_map>

namespace ses {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

} // namespace ses
