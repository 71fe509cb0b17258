/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/client_config.hpp"
#include "ses/internal/url.hpp"
#include "ses/internal/utils.hpp"

#include <cstdlib>

namespace {

// Trimmed value of an environment variable, empty when unset.
std::string env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return {};
    std::string s(v);
    ses::internal::trim_inplace(s);
    return s;
}

void fill_if_empty(std::string& dst, const std::string& v) {
    if (dst.empty()) dst = v;
}

} // namespace

namespace ses {

std::string regional_endpoint(const std::string& region) {
    return "https://email." + region + ".amazonaws.com";
}

bool load_env_config(ClientConfig& cfg, std::string& err) {
    fill_if_empty(cfg.creds.access_key_id, env_value("AWS_ACCESS_KEY_ID"));

    fill_if_empty(cfg.creds.secret_access_key, env_value("AWS_SECRET_KEY"));
    fill_if_empty(cfg.creds.secret_access_key, env_value("AWS_SECRET_ACCESS_KEY"));

    fill_if_empty(cfg.creds.region, env_value("AWS_REGION"));
    fill_if_empty(cfg.endpoint, env_value("AWS_SES_ENDPOINT"));

    if (cfg.endpoint.empty() && !cfg.creds.region.empty()) {
        cfg.endpoint = regional_endpoint(cfg.creds.region);
    }
    return validate_config(cfg, err);
}

bool validate_config(const ClientConfig& cfg, std::string& err) {
    if (cfg.creds.access_key_id.empty()) {
        err = "access key id is not set (AWS_ACCESS_KEY_ID)";
        return false;
    }
    if (cfg.creds.secret_access_key.empty()) {
        err = "secret access key is not set (AWS_SECRET_KEY)";
        return false;
    }
    if (cfg.scheme == SignScheme::SigV4 && cfg.creds.region.empty()) {
        err = "region is not set (AWS_REGION); SigV4 needs it for the credential scope";
        return false;
    }
    if (cfg.endpoint.empty()) {
        err = "endpoint is not set (AWS_SES_ENDPOINT)";
        return false;
    }
    internal::Url url;
    return internal::parse_url(cfg.endpoint, url, err);
}

} // namespace ses
