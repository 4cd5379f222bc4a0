/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#pragma once
#include <string>

namespace sp {

// Thread-safe logging (to stdout, plus a file when one is set).
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// "[DEBUG]" lines are dropped unless enabled.
void set_log_debug(bool on);
bool log_debug_enabled();
void log_debug(const std::string& line);

} // namespace sp
