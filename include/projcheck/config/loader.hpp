/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <projcheck/config/types.hpp>

namespace projcheck::config {

// Parse "1/0/true/false/yes/no/on/off" (case-insensitive).
std::optional<bool> parse_bool(std::string_view text);

// Read settings from file (JSON or key=value). Returns list of errors (empty if ok).
// A missing file is not an error.
std::vector<std::string> load_from_file(Settings& cfg, const std::string& path);

// Parse settings from already-read text (same formats as load_from_file).
std::vector<std::string> load_from_text(Settings& cfg, const std::string& text);

// Apply PROJCHECK_* environment variables on top of current cfg.
std::vector<std::string> apply_env_overrides(Settings& cfg);

// load_from_file followed by apply_env_overrides. Errors are prefixed with
// their source: the file path or "environment".
std::vector<std::string> load_settings(Settings& cfg, const std::string& path);

// Run every configured value through its validator. Returns "<field>: <message>" lines.
std::vector<std::string> validate_project(const Settings& cfg);

} // namespace projcheck::config
