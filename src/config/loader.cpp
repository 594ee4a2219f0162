/*
 * Settings loading and project validation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/config/loader.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <projcheck/validation/domain.hpp>
#include <projcheck/validation/repository_url.hpp>

namespace projcheck::config {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::optional<bool> parse_bool(std::string_view text) {
    std::string v(text);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

static void load_key_value(Settings& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (key == "repo") cfg.project.repo = val;
        else if (key == "submodule") cfg.project.submodules.push_back(val);
        else if (key == "domain") cfg.project.domains.push_back(val);
        else if (key == "allow_private_repos" || key == "debug" || key == "accept_idna") {
            auto b = parse_bool(val);
            if (!b) {
                errs.push_back(fmt::format("line {}: '{}' must be a boolean, got '{}'", lineno, key, val));
                continue;
            }
            if (key == "allow_private_repos") cfg.policy.allow_private_repos = *b;
            else if (key == "debug") cfg.policy.debug_mode = *b;
            else cfg.accept_idna = *b;
        }
    }
}

static void load_json(Settings& cfg, const std::string& text, std::vector<std::string>& errs) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("config root must be a JSON object");
            return;
        }
        auto expect = [&](const char* key, bool ok, const char* what) {
            if (j.contains(key) && !ok) errs.push_back(fmt::format("'{}' must be {}", key, what));
        };
        auto string_array = [&](const char* key) {
            if (!j.contains(key)) return true;
            const auto& a = j.at(key);
            return a.is_array() && std::all_of(a.begin(), a.end(), [](const nlohmann::json& e) { return e.is_string(); });
        };
        expect("repo", j.contains("repo") && j.at("repo").is_string(), "a string");
        expect("submodules", string_array("submodules"), "an array of strings");
        expect("domains", string_array("domains"), "an array of strings");
        for (const char* key : {"allow_private_repos", "debug", "accept_idna"}) {
            expect(key, j.contains(key) && j.at(key).is_boolean(), "a boolean");
        }
        if (!errs.empty()) return;

        if (j.contains("repo")) cfg.project.repo = j.at("repo").get<std::string>();
        if (j.contains("submodules")) cfg.project.submodules = j.at("submodules").get<std::vector<std::string>>();
        if (j.contains("domains")) cfg.project.domains = j.at("domains").get<std::vector<std::string>>();
        if (j.contains("allow_private_repos")) cfg.policy.allow_private_repos = j.at("allow_private_repos").get<bool>();
        if (j.contains("debug")) cfg.policy.debug_mode = j.at("debug").get<bool>();
        if (j.contains("accept_idna")) cfg.accept_idna = j.at("accept_idna").get<bool>();
    } catch (const std::exception& ex) {
        errs.push_back(fmt::format("Failed to read config: {}", ex.what()));
    }
}

std::vector<std::string> load_from_text(Settings& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        load_json(cfg, text, errs);
    } else {
        load_key_value(cfg, text, errs);
    }
    return errs;
}

std::vector<std::string> load_from_file(Settings& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(Settings& cfg) {
    std::vector<std::string> errs;
    auto env_bool = [&](const char* name, bool& target) {
        const char* v = std::getenv(name);
        if (!v) return;
        if (auto b = parse_bool(v)) target = *b;
        else errs.push_back(fmt::format("{} must be a boolean, got '{}'", name, v));
    };
    env_bool("PROJCHECK_ALLOW_PRIVATE_REPOS", cfg.policy.allow_private_repos);
    env_bool("PROJCHECK_DEBUG", cfg.policy.debug_mode);
    env_bool("PROJCHECK_ACCEPT_IDNA", cfg.accept_idna);
    if (const char* v = std::getenv("PROJCHECK_REPO")) cfg.project.repo = v;
    return errs;
}

std::vector<std::string> load_settings(Settings& cfg, const std::string& path) {
    std::vector<std::string> errs;
    for (const auto& e : load_from_file(cfg, path)) errs.push_back(fmt::format("{}: {}", path, e));
    for (const auto& e : apply_env_overrides(cfg)) errs.push_back(fmt::format("environment: {}", e));
    return errs;
}

std::vector<std::string> validate_project(const Settings& cfg) {
    using namespace projcheck::validation;

    std::vector<std::string> errs;
    const auto& p = cfg.project;
    if (!p.repo.empty()) {
        auto o = validate_repository_url(p.repo, cfg.policy);
        if (!o) errs.push_back(fmt::format("repo: {}", o.message));
    }
    for (std::size_t i = 0; i < p.submodules.size(); ++i) {
        auto o = validate_submodule_url(p.submodules[i], cfg.policy);
        if (!o) errs.push_back(fmt::format("submodules[{}]: {}", i, o.message));
    }
    for (std::size_t i = 0; i < p.domains.size(); ++i) {
        auto o = validate_domain_name(p.domains[i], cfg.accept_idna);
        if (!o) errs.push_back(fmt::format("domains[{}]: {}", i, o.message));
    }
    return errs;
}

} // namespace projcheck::config
