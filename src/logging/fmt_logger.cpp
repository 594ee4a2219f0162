/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/logging/fmt_logger.hpp>

#include <cstdio>

#include <fmt/color.h>
#include <fmt/core.h>

namespace projcheck::logging {

static std::string_view level_name(Level level) {
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
    }
    return "?";
}

static fmt::text_style level_style(Level level) {
    switch (level) {
    case Level::Warn:  return fmt::fg(fmt::terminal_color::yellow);
    case Level::Error: return fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold;
    case Level::Debug: return fmt::fg(fmt::terminal_color::bright_black);
    default:           return {};
    }
}

void FmtLogger::log(Level level, std::string_view msg) {
    if (level == Level::Debug && !enable_debug_.load()) return;

    std::FILE* out = (level == Level::Warn || level == Level::Error) ? stderr : stdout;
    if (color_.load()) {
        fmt::print(out, level_style(level), "{}: [{}]", tag_, level_name(level));
        fmt::print(out, " {}\n", msg);
    } else {
        fmt::print(out, "{}: [{}] {}\n", tag_, level_name(level), msg);
    }
}

} // namespace projcheck::logging
