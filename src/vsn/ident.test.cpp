#include <vsn/ident.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Sanitize identifiers") {
    struct case_ {
        std::string        str;
        vsn::sanitize_mode mode;
        std::string        expect;
    };
    case_ cases[] = {
        {"alpha", vsn::sanitize_mode::numeric, "alpha"},
        {"al_pha!", vsn::sanitize_mode::numeric, "alpha"},
        {"rc-1", vsn::sanitize_mode::numeric, "rc-1"},
        {"01", vsn::sanitize_mode::numeric, "1"},
        {"0042", vsn::sanitize_mode::numeric, "42"},
        {"000", vsn::sanitize_mode::numeric, "0"},
        {"0", vsn::sanitize_mode::numeric, "0"},
        {"0a", vsn::sanitize_mode::numeric, "0a"},
        {"-01", vsn::sanitize_mode::numeric, "-01"},
        {" 0 7 ", vsn::sanitize_mode::numeric, "7"},
        {"01", vsn::sanitize_mode::opaque, "01"},
        {"000", vsn::sanitize_mode::opaque, "000"},
        {"build.5", vsn::sanitize_mode::opaque, "build5"},
        {"", vsn::sanitize_mode::numeric, ""},
        {"!@#", vsn::sanitize_mode::numeric, ""},
        {"é1", vsn::sanitize_mode::numeric, "1"},
    };
    for (auto& [str, mode, expect] : cases) {
        INFO("Sanitizing '" << str << "'");
        CHECK(vsn::sanitize_ident(str, mode) == expect);
    }
}

TEST_CASE("Classify identifiers") {
    CHECK(vsn::classify_ident("12") == vsn::ident_kind::numeric);
    CHECK(vsn::classify_ident("0") == vsn::ident_kind::numeric);
    CHECK(vsn::classify_ident("-5") == vsn::ident_kind::numeric);
    CHECK(vsn::classify_ident("beta") == vsn::ident_kind::alphanumeric);
    CHECK(vsn::classify_ident("1a") == vsn::ident_kind::alphanumeric);
    CHECK(vsn::classify_ident("-") == vsn::ident_kind::alphanumeric);
    CHECK(vsn::classify_ident("") == vsn::ident_kind::alphanumeric);
    // Too large for a 64-bit integer
    CHECK(vsn::classify_ident("99999999999999999999") == vsn::ident_kind::alphanumeric);

    CHECK(vsn::ident_integer("-5") == -5);
    CHECK(vsn::ident_integer("123") == 123);
    CHECK_FALSE(vsn::ident_integer("12x").has_value());
}

TEST_CASE("Ident comparison") {
    using vsn::order;
    struct comp_test {
        std::string lhs;
        std::string rhs;
        order       expect_ordering;
    };
    comp_test comparisons[] = {
        {"foo", "bar", order::greater},
        {"foo", "foo", order::equivalent},
        {"bar", "foo", order::less},
        {"12", "333", order::less},
        {"2", "10", order::less},
        {"fooood", "3", order::greater},
        {"0", "0", order::equivalent},
        {"34", "f", order::less},
        {"1", "beta", order::less},
        {"aaaaaaaaaaa", "z", order::less},
        {"-5", "3", order::less},
        {"10", "1a", order::less},
        {"B", "a", order::less},
        {"-0", "0", order::equivalent},
        // Out of 64-bit range, so compared as text
        {"99999999999999999999", "100000000000000000000", order::greater},
    };
    for (auto& [lhs, rhs, expect] : comparisons) {
        INFO("Comparing '" << lhs << "' to '" << rhs << "'");
        CHECK(vsn::compare_idents(lhs, rhs) == expect);
        CHECK(vsn::compare_idents(rhs, lhs) == vsn::invert(expect));
    }
}
