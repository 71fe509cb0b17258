/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/tls_cli_ctx.hpp"
#include "ses/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace ses::internal {

TlsClientContext::TlsClientContext(const ses::ClientConfig& cfg) {
    OPENSSL_init_ssl(0, nullptr);

    _ctx = SSL_CTX_new(TLS_client_method());
    if (!_ctx) {
        log_last_error("SSL_CTX_new");
        return;
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        log_last_error("set_min_proto");
    }

    // Trust store
    if (!cfg.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, cfg.tls_ca_file.c_str(), nullptr) != 1) {
            log_last_error("load_verify_locations(CA)");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_last_error("set_default_verify_paths");
        }
    }

    SSL_CTX_set_verify(_ctx, cfg.tls_verify_peer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    SSL_CTX_set_mode(_ctx, SSL_MODE_AUTO_RETRY);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Peers answering "Connection: close" often skip close_notify.
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

void TlsClientContext::log_last_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        ses::log_line(std::string("[TLS-CLI] error at ") + where + ": " + buf);
    }
}

} // namespace ses::internal
