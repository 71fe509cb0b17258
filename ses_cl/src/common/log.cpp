/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/log.hpp"
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
} // namespace

namespace ses {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    if (!path.empty()) {
        g_log_ofs.open(path, std::ios::out | std::ios::app);
        if (!g_log_ofs) {
            std::cerr << "[LOG] cannot open log file: " << path << '\n';
        }
    }
}

// stdout is left to the caller (the CLI prints response bodies there).
void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    std::cerr << line << '\n';
}

} // namespace ses
