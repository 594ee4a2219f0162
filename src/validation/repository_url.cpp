/*
 * Repository and submodule URL validation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/validation/repository_url.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace projcheck::validation {

namespace {

constexpr std::array<std::string_view, 5> kPublicSchemes{"https", "http", "git", "ftps", "ftp"};
constexpr std::array<std::string_view, 2> kPrivateSchemes{"ssh", "ssh+git"};
constexpr std::array<std::string_view, 1> kLocalSchemes{"file"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& pool, std::string_view scheme) {
    return std::find(pool.begin(), pool.end(), scheme) != pool.end();
}

bool is_valid_scheme(std::string_view scheme, const config::Policy& policy) {
    if (contains(kPublicSchemes, scheme)) return true;
    if (policy.allow_private_repos && contains(kPrivateSchemes, scheme)) return true;
    if (policy.debug_mode && contains(kLocalSchemes, scheme)) return true;
    return false;
}

// "git@github.com:user/repo" style: one or more word characters from the
// start, '@', then at least one character other than a newline. Word
// characters are Unicode letters and digits plus '_'.
bool looks_like_git_user(std::string_view value) {
    const auto* s = reinterpret_cast<const uint8_t*>(value.data());
    const auto length = static_cast<int32_t>(std::min<std::size_t>(value.size(), INT32_MAX));
    int32_t i = 0;
    int32_t word_chars = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        if (c == '@') return word_chars > 0 && i < length && s[i] != '\n';
        if (c < 0 || !(c == '_' || u_isalnum(c))) return false;
        ++word_chars;
    }
    return false;
}

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace

std::string url_scheme(std::string_view value) {
    std::size_t start = 0;
    while (start < value.size() && static_cast<unsigned char>(value[start]) <= 0x20) ++start;

    std::string url;
    url.reserve(value.size() - start);
    for (std::size_t i = start; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\t' || c == '\r' || c == '\n') continue;
        url.push_back(c);
    }

    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) return {};
    const auto first = static_cast<unsigned char>(url[0]);
    if (first > 0x7f || !std::isalpha(first)) return {};
    if (!std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon), is_scheme_char)) return {};

    std::string scheme = url.substr(0, colon);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

Outcome validate_repository_url(std::string_view value, const config::Policy& policy, const UrlRules& rules) {
    // Shell metacharacters are refused before any parsing.
    if (value.find("&&") != std::string_view::npos || value.find('|') != std::string_view::npos) {
        return Outcome::reject(Rejection::InvalidCharacter, "Invalid character in the URL");
    }

    const std::string scheme = url_scheme(value);
    if (is_valid_scheme(scheme, policy)) return Outcome::accept(value);

    // Launchpad
    if (starts_with(value, "lp:")) return Outcome::accept(value);

    if (starts_with(value, ".") && !rules.disallow_relative) return Outcome::accept(value);

    if (looks_like_git_user(value) || contains(kPrivateSchemes, scheme)) {
        if (policy.allow_private_repos) return Outcome::accept(value);
        return Outcome::reject(Rejection::PrivateCloningNotSupported, "Manual cloning via SSH is not supported");
    }

    return Outcome::reject(Rejection::UnsupportedScheme, "Invalid scheme for URL");
}

Outcome validate_submodule_url(std::string_view value, const config::Policy& policy) {
    return validate_repository_url(value, policy, kSubmoduleUrlRules);
}

} // namespace projcheck::validation
