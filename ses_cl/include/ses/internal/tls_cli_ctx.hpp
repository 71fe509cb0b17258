/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "ses/client_config.hpp"

namespace ses::internal {

// Minimal TLS client context. Loads system CA or custom CA and sets the
// verification mode; SNI and hostname checks are per connection.
class TlsClientContext {
public:
    explicit TlsClientContext(const ses::ClientConfig& cfg);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    void log_last_error(const char* where);
};

} // namespace ses::internal
