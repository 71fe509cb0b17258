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
#include <variant>
#include <vector>

namespace ses {

// Plain text mail. `from` must be a verified sender address.
struct PlainTextEmail {
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    std::string subject;
    std::string body;
};

// Multipart text + HTML mail.
struct HtmlEmail {
    std::string from;
    std::vector<std::string> to;
    std::vector<std::string> cc;
    std::vector<std::string> bcc;
    std::string subject;
    std::string text_body;
    std::string html_body;
};

// Already formatted MIME document, sent as is.
struct RawEmail {
    std::string message;  // raw bytes
};

using SendIntent = std::variant<PlainTextEmail, HtmlEmail, RawEmail>;

} // namespace ses
