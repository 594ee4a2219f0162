/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <string>
#include <string_view>

#include <projcheck/config/types.hpp>
#include <projcheck/validation/outcome.hpp>

namespace projcheck::validation {

struct UrlRules {
    bool disallow_relative{true};
};

inline constexpr UrlRules kRepositoryUrlRules{true};
// Submodules may be relative to the superproject's remote origin ("./x", "../x").
inline constexpr UrlRules kSubmoduleUrlRules{false};

// Scheme of a URL as a URL splitter sees it: lowercased text before the first
// ':' if it is a valid scheme token, empty otherwise.
std::string url_scheme(std::string_view value);

// Check a repository URL against the scheme allowlist for the given policy.
// Accepted values are returned unchanged.
Outcome validate_repository_url(std::string_view value, const config::Policy& policy,
                                const UrlRules& rules = kRepositoryUrlRules);

inline Outcome validate_repository_url(std::string_view value, bool allow_private, bool debug_mode,
                                       bool disallow_relative = true) {
    return validate_repository_url(value, config::Policy{allow_private, debug_mode},
                                   UrlRules{disallow_relative});
}

Outcome validate_submodule_url(std::string_view value, const config::Policy& policy);

} // namespace projcheck::validation
