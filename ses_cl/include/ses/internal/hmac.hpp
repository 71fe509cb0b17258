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

namespace ses::internal {

// HMAC-SHA256(key, msg) -> 32 bytes (binary) as std::string
bool hmac_sha256_bin(const std::string& key_bin,
                     const std::string& msg,
                     std::string& out_bin);

} // namespace ses::internal
