/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <string_view>

namespace projcheck::logging {

enum class Level { Debug, Info, Warn, Error };

// Sink for diagnostics. Implementations only provide log(); the level
// helpers forward to it.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(Level level, std::string_view msg) = 0;

    void debug(std::string_view msg) { log(Level::Debug, msg); }
    void info(std::string_view msg) { log(Level::Info, msg); }
    void warn(std::string_view msg) { log(Level::Warn, msg); }
    void error(std::string_view msg) { log(Level::Error, msg); }
};

} // namespace projcheck::logging
