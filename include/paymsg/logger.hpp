/**
 * paymsg - version 1.00
 * --------------------------------------------------------
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 * 
 */

#pragma once
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace paymsg {

/**
 * @brief Process-wide, level-filtered logger.
 *
 * Writes to std::clog, one line per call, serialized by a mutex. The engine
 * only logs degradations (null fallbacks, placeholder substitutions), never
 * the content of PII fields.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error,
        Off
    };

    static void set_level(Level level) { threshold().store(level); }
    static Level level() { return threshold().load(); }

    static bool enabled(Level level) {
        return level != Level::Off && level >= threshold().load();
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* prefix = "";
        switch (level) {
            case Level::Debug:   prefix = "debug: ";   break;
            case Level::Info:    prefix = "info: ";    break;
            case Level::Warning: prefix = "warning: "; break;
            case Level::Error:   prefix = "error: ";   break;
            case Level::Off:     return;
        }

        std::clog << "[paymsg] " << prefix << message << std::endl;
    }

    static void debug(const std::string& msg) { log(Level::Debug, msg); }
    static void info(const std::string& msg)  { log(Level::Info, msg); }
    static void warn(const std::string& msg)  { log(Level::Warning, msg); }
    static void error(const std::string& msg) { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Warning};
        return level;
    }
};

// Logging configuration. PAYMSG_LOG_LEVEL = debug|info|warning|error|off
struct LogConfig {
    Logger::Level level = Logger::Level::Warning;

    static LogConfig from_env() {
        LogConfig cfg;
        const char* env = std::getenv("PAYMSG_LOG_LEVEL");
        if (!env) return cfg;

        const std::string v = env;
        if (v == "debug")        cfg.level = Logger::Level::Debug;
        else if (v == "info")    cfg.level = Logger::Level::Info;
        else if (v == "warning") cfg.level = Logger::Level::Warning;
        else if (v == "error")   cfg.level = Logger::Level::Error;
        else if (v == "off")     cfg.level = Logger::Level::Off;
        return cfg;
    }

    void apply() const { Logger::set_level(level); }
};

} // namespace paymsg
