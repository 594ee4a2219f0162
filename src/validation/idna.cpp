/*
 * IDNA (UTS #46) encoding through ICU
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <projcheck/validation/idna.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>
#include <unicode/uidna.h>

namespace projcheck::validation::idna {

namespace {

struct UidnaCloser {
    void operator()(UIDNA* p) const { uidna_close(p); }
};

// UTS46 instances are immutable once opened and safe to share across threads.
const UIDNA& transcoder() {
    static const std::unique_ptr<UIDNA, UidnaCloser> instance = [] {
        UErrorCode err = U_ZERO_ERROR;
        UIDNA* p = uidna_openUTS46(UIDNA_DEFAULT, &err);
        if (U_FAILURE(err) || p == nullptr) {
            throw std::runtime_error(fmt::format("uidna_openUTS46 failed: {}", u_errorName(err)));
        }
        return std::unique_ptr<UIDNA, UidnaCloser>(p);
    }();
    return *instance;
}

// Hyphen placement is left to the domain grammar, which also sets no limit
// on the total length of a name. Label length is still enforced here.
constexpr uint32_t kTolerated = UIDNA_ERROR_LEADING_HYPHEN | UIDNA_ERROR_TRAILING_HYPHEN | UIDNA_ERROR_HYPHEN_3_4 |
                                UIDNA_ERROR_DOMAIN_NAME_TOO_LONG;

} // namespace

std::optional<std::string> to_ascii(std::string_view name) {
    if (name.empty() || name.size() > static_cast<std::size_t>(INT32_MAX)) return std::nullopt;

    const auto length = static_cast<int32_t>(name.size());
    std::vector<char> out(name.size() * 4 + 64);
    for (int attempt = 0; attempt < 2; ++attempt) {
        UErrorCode err = U_ZERO_ERROR;
        UIDNAInfo info = UIDNA_INFO_INITIALIZER;
        int32_t n = uidna_nameToASCII_UTF8(&transcoder(), name.data(), length, out.data(),
                                           static_cast<int32_t>(out.size()), &info, &err);
        if (err == U_BUFFER_OVERFLOW_ERROR) {
            out.resize(static_cast<std::size_t>(n) + 1);
            continue;
        }
        if (U_FAILURE(err)) return std::nullopt;
        if ((info.errors & ~kTolerated) != 0) return std::nullopt;
        return std::string(out.data(), static_cast<std::size_t>(n));
    }
    return std::nullopt;
}

} // namespace projcheck::validation::idna
