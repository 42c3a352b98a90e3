/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#include "rhc/log.hpp"
#include <chrono>
#include <ctime>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <cstdio>
#include <exception>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path = "client.log";

void open_if_needed_unlocked() {
    if (!g_log_ofs.is_open() && !g_log_path.empty()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string utc_timestamp_ms() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40]{0};
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
    return buf;
}
} // namespace

namespace rhc {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (path == g_log_path && g_log_ofs.is_open()) return;
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

void LineLogger::write(LogLevel level, const std::string& msg, const LogMeta& meta) {
    std::ostringstream oss;
    oss << utc_timestamp_ms() << (level == LogLevel::Error ? " ERROR [" : " INFO [") << _tag << "] " << msg;
    for (const auto& kv : meta) {
        oss << ' ' << kv.first << '=' << kv.second;
    }
    log_line(oss.str());
}

void safe_log(Logger& lg, LogLevel level, const std::string& msg, const LogMeta& meta) noexcept {
    try {
        if (level == LogLevel::Error) lg.error(msg, meta);
        else lg.info(msg, meta);
    } catch (const std::exception& e) {
        log_line(std::string("[LOG] logger failed: ") + e.what());
    } catch (...) {
        log_line("[LOG] logger failed: unknown error");
    }
}

} // namespace rhc
