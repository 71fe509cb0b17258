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
#include "ses/client_config.hpp"
#include "ses/http_request.hpp"
#include "ses/http_response.hpp"

namespace ses {

// The single capability the client needs from the network: perform one
// request and hand back the complete response. Implementations own their
// connections, timeouts and TLS; the client never retries.
class Transport {
public:
    virtual ~Transport() = default;

    // Returns false on connection/DNS/TLS/IO failure with err filled in.
    // Any HTTP status, including errors, is a successful transport call.
    // A non-200 response whose body was cut short is still returned, with
    // the part of the body that arrived.
    virtual bool send(const HttpRequest& req, HttpResponse& out, std::string& err) = 0;
};

// Default HTTP/1.1 transport over plain TCP or OpenSSL TLS.
// One connection per request, always closed before send() returns.
// Thread-safe: concurrent send() calls share only the immutable TLS context.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(const ClientConfig& cfg);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    bool send(const HttpRequest& req, HttpResponse& out, std::string& err) override;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace ses
