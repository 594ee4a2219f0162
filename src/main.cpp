/*
 * projcheck: validate repository URLs and domain names before they are stored
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>

#include <projcheck/cli/args.hpp>
#include <projcheck/config/loader.hpp>
#include <projcheck/logging/fmt_logger.hpp>

using namespace projcheck;

// File first, then environment, then CLI (highest precedence).
static config::Settings merge(config::Settings file_cfg, const config::Settings& cli) {
    if (!cli.project.repo.empty()) file_cfg.project.repo = cli.project.repo;
    file_cfg.project.submodules.insert(file_cfg.project.submodules.end(),
                                       cli.project.submodules.begin(), cli.project.submodules.end());
    file_cfg.project.domains.insert(file_cfg.project.domains.end(),
                                    cli.project.domains.begin(), cli.project.domains.end());
    file_cfg.policy.allow_private_repos = file_cfg.policy.allow_private_repos || cli.policy.allow_private_repos;
    file_cfg.policy.debug_mode = file_cfg.policy.debug_mode || cli.policy.debug_mode;
    file_cfg.accept_idna = file_cfg.accept_idna && cli.accept_idna;
    return file_cfg;
}

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 1;
    }
    log.set_debug(parsed.verbose);
    log.set_color(isatty(fileno(stderr)) != 0);

    config::Settings file_cfg;
    auto errs = config::load_settings(file_cfg, parsed.config_path);
    for (const auto& e : errs) log.error(e);
    if (!errs.empty()) return 1;

    const auto cfg = merge(std::move(file_cfg), *parsed.cfg);
    log.debug(fmt::format("policy: allow_private_repos={} debug={} accept_idna={}",
                          cfg.policy.allow_private_repos, cfg.policy.debug_mode, cfg.accept_idna));

    const auto& p = cfg.project;
    if (p.repo.empty() && p.submodules.empty() && p.domains.empty()) {
        log.warn("nothing to validate (use --repo, --submodule or --domain)");
        return 0;
    }

    auto problems = config::validate_project(cfg);
    for (const auto& e : problems) log.error(e);
    if (!problems.empty()) return 1;

    log.info(fmt::format("{} value(s) accepted",
                         (p.repo.empty() ? 0 : 1) + p.submodules.size() + p.domains.size()));
    return 0;
}
