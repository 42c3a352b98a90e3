/*
 * Part of the ResilientHttp (RHC) project.
 *
 * SPDX-FileCopyrightText: 2025 ResilientHttp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of ResilientHttp (RHC). See LICENSE for details.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>

namespace rhc {

// Thread-safe logging (to file + stdout). An empty path disables the file sink.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

using LogMeta = std::vector<std::pair<std::string, std::string>>;

enum class LogLevel { Info, Error };

// Leveled logger seam. Implementations must be thread-safe.
class Logger {
public:
    virtual ~Logger() = default;

    void info(const std::string& msg, const LogMeta& meta = {}) { write(LogLevel::Info, msg, meta); }
    void error(const std::string& msg, const LogMeta& meta = {}) { write(LogLevel::Error, msg, meta); }

protected:
    virtual void write(LogLevel level, const std::string& msg, const LogMeta& meta) = 0;
};

// "2025-01-01T00:00:00.000Z INFO [CLIENT] msg key=value" into log_line().
class LineLogger : public Logger {
public:
    explicit LineLogger(std::string tag = "CLIENT") : _tag(std::move(tag)) {}

protected:
    void write(LogLevel level, const std::string& msg, const LogMeta& meta) override;

private:
    std::string _tag;
};

// Logs through lg; a failing logger is reported to log_line() and never propagates.
void safe_log(Logger& lg, LogLevel level, const std::string& msg, const LogMeta& meta = {}) noexcept;

} // namespace rhc
