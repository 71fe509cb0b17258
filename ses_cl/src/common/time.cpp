/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/time.hpp"
#include <cstdio>

namespace ses::internal {
namespace {

std::tm utc_tm(std::time_t t) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}

} // namespace

// Formatted by hand: strftime's %a/%b follow the process locale.
std::string http_date(std::time_t t) {
    static const char* kDays[]   = {"Sun","Mon","Tue","Wed","Thu","Fri","Sat"};
    static const char* kMonths[] = {"Jan","Feb","Mar","Apr","May","Jun",
                                    "Jul","Aug","Sep","Oct","Nov","Dec"};
    const std::tm tm = utc_tm(t);
    char buf[40]{0};
    const int n = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d +0000",
                                kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon],
                                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf, n > 0 ? (std::size_t)n : 0);
}

std::string amz_date(std::time_t t) {
    const std::tm tm = utc_tm(t);
    char buf[32]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return std::string(buf, n);
}

std::string amz_day(std::time_t t) {
    const std::tm tm = utc_tm(t);
    char buf[16]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return std::string(buf, n);
}

} // namespace ses::internal
