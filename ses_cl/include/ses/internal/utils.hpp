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
#include <cstddef>
#include <cstdint>

namespace ses::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);
std::string sha256_hex(const std::string& data);
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);
void secure_wipe(std::string& s);

// Standard alphabet, padded (OpenSSL EVP_EncodeBlock / EVP_DecodeBlock).
std::string base64_encode(const std::string& bin);
bool base64_decode(const std::string& b64, std::string& out);

// RFC 3986 percent-encoding; everything but A-Z a-z 0-9 - . _ ~ becomes %XX.
// keep_slash leaves '/' untouched (URI paths).
std::string uri_encode(const std::string& s, bool keep_slash = false);

// Form/query decoding: %XX becomes the byte, '+' becomes a space.
// A malformed escape is kept as-is.
std::string url_unescape(const std::string& s);

} // namespace ses::internal
