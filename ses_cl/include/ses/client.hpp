/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ses/client_config.hpp"
#include "ses/send_intent.hpp"
#include "ses/transport.hpp"
#include "ses/types.hpp"

namespace ses {

// Amazon SES client: builds, signs and dispatches one request per call.
// Stateless between calls; safe to share across threads.
class Client {
public:
    // Uses the default HttpTransport.
    explicit Client(const ClientConfig& cfg);
    Client(const ClientConfig& cfg, std::shared_ptr<Transport> transport);
    ~Client();

    // Generic entry point. On success out_body holds the provider response
    // (SendEmailResponse / SendRawEmailResponse XML) verbatim.
    bool send(const SendIntent& intent, std::string& out_body, SendError& err);

    // Convenience wrappers
    bool send_email(const std::string& from,
                    const std::vector<std::string>& to,
                    const std::vector<std::string>& cc,
                    const std::vector<std::string>& bcc,
                    const std::string& subject,
                    const std::string& body,
                    std::string& out_body, SendError& err);

    bool send_email_html(const std::string& from,
                         const std::vector<std::string>& to,
                         const std::vector<std::string>& cc,
                         const std::vector<std::string>& bcc,
                         const std::string& subject,
                         const std::string& text_body,
                         const std::string& html_body,
                         std::string& out_body, SendError& err);

    bool send_raw_email(const std::string& raw, std::string& out_body, SendError& err);

    const ClientConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace ses
