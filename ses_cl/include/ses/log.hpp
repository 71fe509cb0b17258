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

// Thread-safe logging (stderr + optional file). Empty path disables the file.
// The file is process-wide; applications set it once at startup.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace ses
