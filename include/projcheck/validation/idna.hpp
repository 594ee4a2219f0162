/*
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace projcheck::validation::idna {

// Convert a UTF-8 domain name to its ASCII-compatible form (UTS #46,
// transitional mapping). Returns std::nullopt when the name cannot be encoded.
// Throws std::runtime_error if the ICU transcoder cannot be created.
std::optional<std::string> to_ascii(std::string_view name);

} // namespace projcheck::validation::idna
