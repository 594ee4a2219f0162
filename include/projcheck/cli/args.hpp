/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <projcheck/config/types.hpp>
#include <projcheck/logging/logger.hpp>

namespace projcheck::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
projcheck::config::ParseResult parse(int argc, char** argv, projcheck::logging::Logger& log);

} // namespace projcheck::cli
