/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/client.hpp"
#include "ses/log.hpp"
#include "ses/request_builder.hpp"
#include "ses/signer.hpp"

#include <ctime>

namespace ses {

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None:         return "none";
        case ErrorKind::Construction: return "construction";
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Api:          return "api";
    }
    return "unknown";
}

struct Client::Impl {
    const ClientConfig cfg;
    std::shared_ptr<Transport> transport;
    std::string config_error;  // non-empty -> every send fails before any I/O

    Impl(const ClientConfig& c, std::shared_ptr<Transport> t)
        : cfg(c), transport(std::move(t)) {
        if (!validate_config(cfg, config_error)) {
            ses::log_line("[SES] invalid configuration: " + config_error);
        } else if (!transport) {
            config_error = "no transport";
            ses::log_line("[SES] invalid configuration: no transport");
        }
    }

    static bool fail(SendError& err, ErrorKind kind, std::string message) {
        err.kind = kind;
        err.message = std::move(message);
        ses::log_line(std::string("[SES] ") + to_string(kind) + " error: " + err.message);
        return false;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg, std::make_shared<HttpTransport>(cfg))) {}

Client::Client(const ClientConfig& cfg, std::shared_ptr<Transport> transport)
    : _p(std::make_unique<Client::Impl>(cfg, std::move(transport))) {}

Client::~Client() = default;

const ClientConfig& Client::config() const { return _p->cfg; }

bool Client::send(const SendIntent& intent, std::string& out_body, SendError& err) {
    err = SendError{};
    out_body.clear();

    if (!_p->config_error.empty()) {
        return Impl::fail(err, ErrorKind::Construction, _p->config_error);
    }

    const FormParams data = build_request(intent, _p->cfg.creds.access_key_id);

    HttpRequest req;
    req.method = "POST";
    req.url    = _p->cfg.endpoint;
    req.body   = data.encode();
    req.set_header("Content-Type", "application/x-www-form-urlencoded");

    std::string sign_err;
    if (!sign_request(req, _p->cfg, std::time(nullptr), sign_err)) {
        return Impl::fail(err, ErrorKind::Construction, sign_err);
    }

    HttpResponse resp;
    std::string terr;
    if (!_p->transport->send(req, resp, terr)) {
        return Impl::fail(err, ErrorKind::Transport, terr);
    }

    if (resp.status_code != 200) {
        err.status_code = resp.status_code;
        err.body = resp.body;
        return Impl::fail(err, ErrorKind::Api,
                          std::string(action_name(intent)) + " rejected with HTTP " +
                          std::to_string(resp.status_code) + ": " + resp.body);
    }

    out_body.swap(resp.body);
    return true;
}

bool Client::send_email(const std::string& from,
                        const std::vector<std::string>& to,
                        const std::vector<std::string>& cc,
                        const std::vector<std::string>& bcc,
                        const std::string& subject,
                        const std::string& body,
                        std::string& out_body, SendError& err) {
    return send(PlainTextEmail{from, to, cc, bcc, subject, body}, out_body, err);
}

bool Client::send_email_html(const std::string& from,
                             const std::vector<std::string>& to,
                             const std::vector<std::string>& cc,
                             const std::vector<std::string>& bcc,
                             const std::string& subject,
                             const std::string& text_body,
                             const std::string& html_body,
                             std::string& out_body, SendError& err) {
    return send(HtmlEmail{from, to, cc, bcc, subject, text_body, html_body}, out_body, err);
}

bool Client::send_raw_email(const std::string& raw, std::string& out_body, SendError& err) {
    return send(RawEmail{raw}, out_body, err);
}

} // namespace ses
