/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace projcheck::validation {

enum class Rejection {
    InvalidDomainFormat,
    InternationalizedNotAccepted,
    InvalidCharacter,
    UnsupportedScheme,
    PrivateCloningNotSupported,
};

// Stable identifier for a rejection category (e.g. "invalid_character").
std::string_view to_string(Rejection r);

// Result of a single validation call. Accepted outcomes carry the value
// exactly as given; rejected ones carry the category and a user-facing message.
struct Outcome {
    std::string value;
    std::optional<Rejection> rejection;
    std::string message;

    bool accepted() const { return !rejection.has_value(); }
    explicit operator bool() const { return accepted(); }

    static Outcome accept(std::string_view v) { return Outcome{std::string(v), std::nullopt, {}}; }
    static Outcome reject(Rejection r, std::string msg) { return Outcome{{}, r, std::move(msg)}; }
};

} // namespace projcheck::validation
