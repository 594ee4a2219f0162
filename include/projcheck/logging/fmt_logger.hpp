/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <projcheck/logging/logger.hpp>

#include <atomic>
#include <string>
#include <utility>

namespace projcheck::logging {

// Writes "<tag>: [LEVEL] message" lines. Info/debug go to stdout,
// warnings and errors to stderr. Debug lines are dropped unless enabled.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(std::string tag = "projcheck", bool enable_debug = false)
        : tag_(std::move(tag)), enable_debug_(enable_debug) {}

    void log(Level level, std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    void set_color(bool v) { color_.store(v); }

private:
    std::string tag_;
    std::atomic<bool> enable_debug_{false};
    std::atomic<bool> color_{false};
};

} // namespace projcheck::logging
