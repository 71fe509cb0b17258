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

namespace ses {

// Request authentication scheme. The two are not interchangeable on the wire:
// pick the one the target endpoint version expects.
enum class SignScheme {
    SigV4,     // AWS4-HMAC-SHA256, scoped to date/region/service
    Aws3Https  // AWS3-HTTPS, HMAC over the Date header only
};

enum class ErrorKind {
    None,
    Construction,  // bad config / endpoint / signing, nothing was sent
    Transport,     // connect, DNS, TLS or I/O failure
    Api            // provider answered with a non-200 status
};

// Failure details of a send call. status_code/body are set for ErrorKind::Api.
struct SendError {
    ErrorKind   kind = ErrorKind::None;
    int         status_code = 0;
    std::string body;
    std::string message;
};

const char* to_string(ErrorKind k);

} // namespace ses
