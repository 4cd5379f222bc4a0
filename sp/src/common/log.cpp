/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/log.hpp"
#include <atomic>
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path; // empty: stdout only
std::atomic<bool> g_debug{false};

void open_if_needed_unlocked() {
    if (!g_log_path.empty() && !g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}
} // namespace

namespace sp {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs.is_open() && g_log_ofs) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    std::cout << line << '\n';
}

void set_log_debug(bool on) {
    g_debug.store(on, std::memory_order_relaxed);
}

bool log_debug_enabled() {
    return g_debug.load(std::memory_order_relaxed);
}

void log_debug(const std::string& line) {
    if (!log_debug_enabled()) return;
    log_line("[DEBUG] " + line);
}

} // namespace sp
