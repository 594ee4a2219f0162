/*
 * Unit tests for domain name validation (plain grammar + IDNA fallback)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>

#include <projcheck/validation/domain.hpp>
#include <projcheck/validation/idna.hpp>

using namespace projcheck::validation;

TEST_SUITE("Domain Validator") {
    TEST_CASE("plain grammar - accepted names") {
        for (const char* d : {"example.com", "docs.example.co.uk", "EXAMPLE.COM", "example.com.",
                              "a-b.example.io", "example.museum", "example.technology", "x1.example.b2b",
                              "localhost", "192.168.0.1", "999.999.999.999", "::1", "[2001:db8::1]",
                              "fe80::", "xn--mller-kva.de"}) {
            CAPTURE(d);
            CHECK(matches_domain_grammar(d));
            CHECK(validate_domain_name(d, true).accepted());
            CHECK(validate_domain_name(d, false).accepted());
        }
    }

    TEST_CASE("plain grammar - rejected names") {
        for (const char* d : {"", "example", "-example.com", "example-.com", "example.com-", "example.c",
                              "example..com", ".example.com", "exa mple.com", "http://example.com",
                              "example.com/path", "1.2.3", "foo_bar.com"}) {
            CAPTURE(d);
            CHECK_FALSE(matches_domain_grammar(d));
        }
    }

    TEST_CASE("whole string must match, not a prefix") {
        CHECK_FALSE(matches_domain_grammar("example.com evil"));
        CHECK_FALSE(matches_domain_grammar("example.com\n"));
        CHECK_FALSE(matches_domain_grammar("localhost.evil!"));
        CHECK_FALSE(matches_domain_grammar("1.2.3.4/32"));
    }

    TEST_CASE("label length limit") {
        std::string ok_label(63, 'a');
        CHECK(matches_domain_grammar(ok_label + ".com"));
        std::string long_label(64, 'a');
        CHECK_FALSE(matches_domain_grammar(long_label + ".com"));
    }

    TEST_CASE("rejection reasons and messages") {
        auto with_idna = validate_domain_name("not a domain", true);
        REQUIRE_FALSE(with_idna.accepted());
        CHECK(*with_idna.rejection == Rejection::InvalidDomainFormat);
        CHECK(with_idna.message == "Enter a valid plain or internationalized domain name value");

        auto plain = validate_domain_name("not a domain", false);
        REQUIRE_FALSE(plain.accepted());
        CHECK(*plain.rejection == Rejection::InternationalizedNotAccepted);
        CHECK(plain.message == "Enter a valid domain name value");

        auto empty = validate_domain_name("");
        REQUIRE_FALSE(empty.accepted());
        CHECK(*empty.rejection == Rejection::InvalidDomainFormat);
    }

    TEST_CASE("custom message replaces the default in both modes") {
        DomainOptions opts;
        opts.message = "Bad custom domain";
        auto r1 = validate_domain_name("bad domain", opts);
        CHECK(r1.message == "Bad custom domain");
        CHECK(*r1.rejection == Rejection::InvalidDomainFormat);

        opts.accept_idna = false;
        auto r2 = validate_domain_name("bad domain", opts);
        CHECK(r2.message == "Bad custom domain");
        CHECK(*r2.rejection == Rejection::InternationalizedNotAccepted);
    }

    TEST_CASE("internationalized names") {
        auto ok = validate_domain_name("müller.de");
        CHECK(ok.accepted());
        CHECK(ok.value == "müller.de");

        CHECK(validate_domain_name("bücher.example.com").accepted());
        CHECK(validate_domain_name("straße.de").accepted());
        CHECK(validate_domain_name("例え.テスト").accepted());

        auto off = validate_domain_name("müller.de", false);
        REQUIRE_FALSE(off.accepted());
        CHECK(*off.rejection == Rejection::InternationalizedNotAccepted);
    }

    TEST_CASE("IDNA failures keep the original reason") {
        for (const char* d : {"müller..de", "mü ller.de", "☃", "\xff\xfe.com", "müller.d"}) {
            CAPTURE(d);
            auto r = validate_domain_name(d);
            REQUIRE_FALSE(r.accepted());
            CHECK(*r.rejection == Rejection::InvalidDomainFormat);
            CHECK(r.message == "Enter a valid plain or internationalized domain name value");
        }
    }

    TEST_CASE("idna::to_ascii") {
        CHECK(idna::to_ascii("müller.de").value() == "xn--mller-kva.de");
        CHECK(idna::to_ascii("Example.COM").value() == "example.com");
        CHECK(idna::to_ascii("straße.de").value() == "strasse.de");
        CHECK(idna::to_ascii("例え.テスト").value() == "xn--r8jz45g.xn--zckzah");
        CHECK_FALSE(idna::to_ascii("").has_value());
        CHECK_FALSE(idna::to_ascii("a..b").has_value());
    }

    TEST_CASE("grammar alternatives") {
        CHECK(matches_domain_grammar("LocalHost"));
        CHECK(matches_domain_grammar("example.-com"));
        CHECK(matches_domain_grammar("example.123"));
        CHECK(matches_domain_grammar("[::1"));
        CHECK(matches_domain_grammar("::"));
        CHECK_FALSE(matches_domain_grammar("localhost."));
        CHECK_FALSE(matches_domain_grammar("example.com.."));
        CHECK_FALSE(matches_domain_grammar("1.2.3.4.5"));
        CHECK_FALSE(matches_domain_grammar("[:"));
        CHECK_FALSE(matches_domain_grammar("a:]]"));
        CHECK_FALSE(matches_domain_grammar("g:1"));
    }

    TEST_CASE("very long input does not exhaust the stack") {
        const std::string junk(100000, 'a');
        CHECK_FALSE(matches_domain_grammar(junk));
        CHECK(*validate_domain_name(junk, false).rejection == Rejection::InternationalizedNotAccepted);
        CHECK(*validate_domain_name(junk, true).rejection == Rejection::InvalidDomainFormat);

        std::string many_labels;
        for (int i = 0; i < 50000; ++i) many_labels += "a.";
        many_labels += "com";
        CHECK(validate_domain_name(many_labels, false).accepted());
    }

    TEST_CASE("internationalized names longer than 253 bytes") {
        std::string prefix;
        for (int i = 0; i < 5; ++i) prefix += std::string(60, 'a') + ".";
        REQUIRE(prefix.size() > 253);
        CHECK(validate_domain_name(prefix + "mueller.de").accepted());
        CHECK(validate_domain_name(prefix + "müller.de").accepted());
        CHECK(idna::to_ascii(prefix + "müller.de").value() == prefix + "xn--mller-kva.de");
    }

    TEST_CASE("IDNA label length is still enforced") {
        std::string label = "ü" + std::string(62, 'a');
        CHECK_FALSE(validate_domain_name(label + ".de").accepted());
    }

    TEST_CASE("repeated calls give the same outcome") {
        for (const char* d : {"example.com", "müller.de", "bad domain"}) {
            auto a = validate_domain_name(d);
            auto b = validate_domain_name(d);
            CHECK(a.accepted() == b.accepted());
            CHECK(a.rejection == b.rejection);
            CHECK(a.message == b.message);
        }
    }
}
