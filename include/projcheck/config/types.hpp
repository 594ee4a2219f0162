/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace projcheck::config {

// Trust posture supplied by the environment, read once per validation call.
struct Policy {
    bool allow_private_repos{false};
    bool debug_mode{false};
};

struct ProjectConfig {
    std::string repo;
    std::vector<std::string> submodules;
    std::vector<std::string> domains;
};

struct Settings {
    Policy policy;
    ProjectConfig project;
    bool accept_idna{true};
};

struct ParseResult {
    std::optional<Settings> cfg; // present when arguments were valid
    std::string config_path{"projcheck.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool verbose{false};   // true if --verbose was passed on CLI
};

} // namespace projcheck::config
