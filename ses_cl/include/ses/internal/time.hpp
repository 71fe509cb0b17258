/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <ctime>
#include <string>

namespace ses::internal {

// "Mon, 02 Jan 2006 15:04:05 +0000"
std::string http_date(std::time_t t);
// "20060102T150405Z"
std::string amz_date(std::time_t t);
// "20060102"
std::string amz_day(std::time_t t);

} // namespace ses::internal
