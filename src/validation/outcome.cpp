/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/validation/outcome.hpp>

namespace projcheck::validation {

std::string_view to_string(Rejection r) {
    switch (r) {
    case Rejection::InvalidDomainFormat:          return "invalid_domain_format";
    case Rejection::InternationalizedNotAccepted: return "internationalized_not_accepted";
    case Rejection::InvalidCharacter:             return "invalid_character";
    case Rejection::UnsupportedScheme:            return "unsupported_scheme";
    case Rejection::PrivateCloningNotSupported:   return "private_cloning_not_supported";
    }
    return "unknown";
}

} // namespace projcheck::validation
