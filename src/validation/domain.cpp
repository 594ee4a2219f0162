/*
 * Domain name validation: plain grammar with IDNA fallback
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/validation/domain.hpp>

#include <algorithm>
#include <cctype>

#include <projcheck/validation/idna.hpp>

namespace projcheck::validation {

namespace {

constexpr const char* kMessageIdna = "Enter a valid plain or internationalized domain name value";
constexpr const char* kMessagePlain = "Enter a valid domain name value";

bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 && static_cast<unsigned char>(c) < 0x80; }
bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 && static_cast<unsigned char>(c) < 0x80; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
bool is_ldh(char c) { return is_alnum(c) || c == '-'; }

// Inner label: 1..63 chars of [A-Z0-9-], first and last alphanumeric.
bool is_host_label(std::string_view l) {
    if (l.empty() || l.size() > 63) return false;
    if (!is_alnum(l.front()) || !is_alnum(l.back())) return false;
    return std::all_of(l.begin(), l.end(), is_ldh);
}

// Final label: 2..6 letters, or a [A-Z0-9-] token of 2+ chars not ending in '-'.
bool is_top_label(std::string_view l) {
    if (l.size() < 2) return false;
    if (l.size() <= 6 && std::all_of(l.begin(), l.end(), is_alpha)) return true;
    return std::all_of(l.begin(), l.end(), is_ldh) && l.back() != '-';
}

bool is_dotted_hostname(std::string_view v) {
    if (!v.empty() && v.back() == '.') v.remove_suffix(1);
    auto last_dot = v.rfind('.');
    if (last_dot == std::string_view::npos) return false;
    if (!is_top_label(v.substr(last_dot + 1))) return false;

    std::string_view head = v.substr(0, last_dot);
    std::size_t start = 0;
    while (true) {
        auto dot = head.find('.', start);
        std::size_t end = (dot == std::string_view::npos) ? head.size() : dot;
        if (!is_host_label(head.substr(start, end - start))) return false;
        if (dot == std::string_view::npos) return true;
        start = dot + 1;
    }
}

bool is_localhost(std::string_view v) {
    constexpr std::string_view kLocalhost = "localhost";
    return v.size() == kLocalhost.size() &&
           std::equal(v.begin(), v.end(), kLocalhost.begin(),
                      [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
}

// Four groups of 1..3 digits; values are not range-checked.
bool is_ipv4_like(std::string_view v) {
    int groups = 0;
    std::size_t start = 0;
    while (true) {
        auto dot = v.find('.', start);
        std::size_t end = (dot == std::string_view::npos) ? v.size() : dot;
        auto g = v.substr(start, end - start);
        if (g.empty() || g.size() > 3 || !std::all_of(g.begin(), g.end(), is_digit)) return false;
        ++groups;
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return groups == 4;
}

// Optional brackets around hex digits and colons, with a colon that is not last.
bool is_ipv6_like(std::string_view v) {
    if (!v.empty() && v.front() == '[') v.remove_prefix(1);
    if (!v.empty() && v.back() == ']') v.remove_suffix(1);
    if (!std::all_of(v.begin(), v.end(), [](char c) { return is_hex(c) || c == ':'; })) return false;
    auto colon = v.find(':');
    return colon != std::string_view::npos && colon + 1 < v.size();
}

Outcome plain_rejection(const DomainOptions& opts) {
    if (opts.accept_idna) {
        return Outcome::reject(Rejection::InvalidDomainFormat, opts.message.value_or(kMessageIdna));
    }
    return Outcome::reject(Rejection::InternationalizedNotAccepted, opts.message.value_or(kMessagePlain));
}

} // namespace

bool matches_domain_grammar(std::string_view value) {
    return is_dotted_hostname(value) || is_localhost(value) || is_ipv4_like(value) || is_ipv6_like(value);
}

Outcome validate_domain_name(std::string_view value, const DomainOptions& opts) {
    if (matches_domain_grammar(value)) return Outcome::accept(value);

    Outcome rejected = plain_rejection(opts);
    if (!opts.accept_idna || value.empty()) return rejected;

    auto encoded = idna::to_ascii(value);
    if (!encoded || !matches_domain_grammar(*encoded)) return rejected;
    return Outcome::accept(value);
}

} // namespace projcheck::validation
