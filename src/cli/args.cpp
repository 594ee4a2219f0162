/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/cli/args.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef PROJCHECK_VERSION
#define PROJCHECK_VERSION "0.0.0"
#endif

namespace projcheck::cli {

projcheck::config::ParseResult parse(int argc, char** argv, projcheck::logging::Logger& log) {
    projcheck::config::ParseResult pr;
    cxxopts::Options options("projcheck", "Validate repository URLs and domain names for project settings");
    // clang-format off
    options.add_options()
        ("repo",      "Repository URL", cxxopts::value<std::string>())
        ("submodule", "Submodule URL (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("domain",    "Domain name (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("allow-private-repos", "Accept ssh:// and user@host:path URLs")
        ("debug-mode", "Accept file:// URLs")
        ("no-idna",   "Reject internationalized domain names")
        ("config",    "Path to config file (projcheck.conf)", cxxopts::value<std::string>()->default_value("projcheck.conf"))
        ("d,verbose", "Enable debug logging")
        ("v,version", "Show version and exit")
        ("h,help",    "Show help and exit");
    // clang-format on
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("projcheck v{}", PROJCHECK_VERSION));
            pr.show_only = true;
            return pr;
        }
        projcheck::config::Settings cfg;
        if (result.count("repo")) cfg.project.repo = result["repo"].as<std::string>();
        if (result.count("submodule")) cfg.project.submodules = result["submodule"].as<std::vector<std::string>>();
        if (result.count("domain")) cfg.project.domains = result["domain"].as<std::vector<std::string>>();
        cfg.policy.allow_private_repos = result.count("allow-private-repos") > 0;
        cfg.policy.debug_mode = result.count("debug-mode") > 0;
        cfg.accept_idna = result.count("no-idna") == 0;
        pr.config_path = result["config"].as<std::string>();
        pr.verbose = result.count("verbose") > 0;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace projcheck::cli
