/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace ses::internal {

bool hmac_sha256_bin(const std::string& key_bin,
                     const std::string& msg,
                     std::string& out_bin)
{
    unsigned int mac_len=0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(EVP_sha256(),
                            key_bin.data(), (int)key_bin.size(),
                            (const unsigned char*)msg.data(), msg.size(),
                            mac, &mac_len);
    if(!p || mac_len!=32) return false;
    out_bin.assign((const char*)mac, 32);
    return true;
}

} // namespace ses::internal
