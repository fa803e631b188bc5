/**
 * Multiparty Off-the-Record Messaging library
 * Copyright (C) 2014, eQualit.ie
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of version 3 of the GNU Lesser General
 * Public License as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA
 */

#include <chrono>
#include <string>
#include <iostream>
#include <fstream>
#include <iomanip> // std::setprecision

#include "namespaces.h"
#include "logger.h"

// The log file is rewritten from its start past this size.
static const long LOG_FILE_MAX_SIZE = 15 * 1024 * 1024;

static const char* log_level_announce[] = {"SILLY", "DEBUG", "VERBOSE", "INFO", "WARN", "ERROR", "ABORT"};
static const char* log_level_color[] = {"\033[1;35;47m", "\033[1;32m", "\033[1;37m", "\033[1;34m", "\033[90;103m", "\033[31;40m", "\033[1;31;40m"};
// Whether the whole message (not just the level) is colored.
static const bool log_level_colored_msg[] = {true, false, false, false, true, true, true};

static bool is_valid_level(log_level_t level) {
    return level >= SILLY && level <= ABORT;
}

log_level_t default_log_level() {
    return INFO;
}

boost::optional<log_level_t> log_level_from_string(boost::string_view s) {
    for (int l = SILLY; l <= ABORT; ++l)
        if (s == log_level_announce[l]) return static_cast<log_level_t>(l);
    return boost::none;
}

Logger logger(default_log_level());

// Seconds since the epoch, with sub-second precision.
static double log_get_timestamp()
{
    using namespace std::chrono;
    auto now = duration_cast<microseconds>(system_clock::now().time_since_epoch());
    return double(now.count()) / 1e6;
}

// Levels above ERROR are not accepted as an initial threshold.
Logger::Logger(log_level_t threshold)
    : threshold(is_valid_level(threshold) && threshold != ABORT ? threshold : default_log_level())
    , log_to_stderr(true)
{}

void Logger::log_to_file(std::string fname)
{
    if (fname.empty()) {
        log_filename.clear();
        log_file = boost::none;
        return;
    }

    if (log_file && log_filename == fname) return;

    log_file.emplace(fname, std::ios::out | std::ios::app);
    if (!log_file->is_open()) {
        std::cerr << "Failed to open log file " << fname << "\n";
        log_filename.clear();
        log_file = boost::none;
        return;
    }

    log_filename = std::move(fname);
    *log_file << "\nHTTPSIG START\n";
}

void Logger::set_threshold(log_level_t level)
{
    if (is_valid_level(level)) threshold = level;
}

bool Logger::would_log(log_level_t level) const
{
    return get_threshold() <= level;
}

static
void print( std::ostream& os
          , log_level_t level
          , bool with_color
          , boost::optional<double> ts
          , boost::string_view msg
          , boost::string_view fun)
{
    static const char* color_end = "\033[0m";

    if (ts) {
        // Prevent scientific notation
        os << std::fixed << std::showpoint << std::setprecision(4) << *ts << ": ";
    }

    bool color_msg = with_color && log_level_colored_msg[level];

    if (with_color) os << log_level_color[level];
    os << "[" << log_level_announce[level] << "]";
    if (with_color && !color_msg) os << color_end;
    os << " ";

    if (!fun.empty()) os << fun << ": ";
    os << msg;

    if (color_msg) os << color_end;
    os << "\n";
}

void Logger::log(log_level_t level, const std::string& msg, boost::string_view function_name)
{
    if (!is_valid_level(level) || level < threshold) return;

    boost::optional<double> ts;
    if (_stamp_with_time || log_file) ts = log_get_timestamp();

    if (log_to_stderr) {
        print(std::cerr, level, true, _stamp_with_time ? ts : boost::none, msg, function_name);
    }

    if (log_file) {
        print(*log_file, level, false, ts, msg, function_name);

        if (log_file->tellp() > LOG_FILE_MAX_SIZE) log_file->seekp(0);
    }
}

void Logger::silly(const std::string& msg, boost::string_view function_name)
{
    log(SILLY, msg, function_name);
}

void Logger::debug(const std::string& msg, boost::string_view function_name)
{
    log(DEBUG, msg, function_name);
}

void Logger::verbose(const std::string& msg, boost::string_view function_name)
{
    log(VERBOSE, msg, function_name);
}

void Logger::info(const std::string& msg, boost::string_view function_name)
{
    log(INFO, msg, function_name);
}

void Logger::warn(const std::string& msg, boost::string_view function_name)
{
    log(WARN, msg, function_name);
}

void Logger::error(const std::string& msg, boost::string_view function_name)
{
    log(ERROR, msg, function_name);
}
