/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <projcheck/validation/outcome.hpp>

namespace projcheck::validation {

struct DomainOptions {
    bool accept_idna{true};
    std::optional<std::string> message; // overrides the default rejection message
};

// Whole-string match against the plain domain grammar: dotted hostname,
// "localhost", IPv4 or IPv6-like literal. Case-insensitive.
bool matches_domain_grammar(std::string_view value);

// Validate a plain or internationalized domain name. With accept_idna the
// value is retried in IDNA-encoded form; any failure on that path reports
// the original rejection.
Outcome validate_domain_name(std::string_view value, const DomainOptions& opts = {});

inline Outcome validate_domain_name(std::string_view value, bool accept_idna) {
    DomainOptions opts;
    opts.accept_idna = accept_idna;
    return validate_domain_name(value, opts);
}

} // namespace projcheck::validation
