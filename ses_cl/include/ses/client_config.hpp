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
#include "ses/types.hpp"

namespace ses {

struct Credentials {
    std::string access_key_id;      // e.g. "AKIDEXAMPLE"
    std::string secret_access_key;
    std::string region;             // e.g. "us-east-1"
};

// Public client configuration. Built once at startup and passed by value to
// every Client; read-only afterwards.
struct ClientConfig {
    Credentials creds;

    // Endpoint, e.g. "https://email.us-east-1.amazonaws.com"
    std::string endpoint;

    SignScheme scheme = SignScheme::SigV4;

    // Timeouts (default HttpTransport)
    int connect_timeout_sec = 10;
    int io_timeout_sec      = 10;

    // TLS (https endpoints)
    bool tls_verify_peer = true;
    std::string tls_ca_file;        // optional CA bundle; system store otherwise
};

// Fill cfg from AWS_ACCESS_KEY_ID, AWS_SECRET_KEY (or AWS_SECRET_ACCESS_KEY),
// AWS_REGION and AWS_SES_ENDPOINT. Only empty fields are filled, so values set
// programmatically win. Returns false with err set if the result is unusable.
bool load_env_config(ClientConfig& cfg, std::string& err);

// Checks that cfg carries everything a send needs.
bool validate_config(const ClientConfig& cfg, std::string& err);

// "https://email.<region>.amazonaws.com"
std::string regional_endpoint(const std::string& region);

} // namespace ses
