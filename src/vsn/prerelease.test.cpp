#include "./prerelease.hpp"

#include <catch2/catch.hpp>

using strings = std::vector<std::string>;

TEST_CASE("Parse a prerelease") {
    auto pre = vsn::prerelease::parse("foo.bar");
    CHECK(pre.idents() == strings{"foo", "bar"});
    pre = vsn::prerelease::parse("rc.007");
    CHECK(pre.idents() == strings{"rc", "7"});
    CHECK(pre.to_string() == "rc.7");

    // Empty and unusable pieces are dropped
    pre = vsn::prerelease::parse("a..b.%");
    CHECK(pre.idents() == strings{"a", "b"});

    CHECK(vsn::prerelease::parse("").empty());
    CHECK(vsn::prerelease::parse("...").empty());
}

TEST_CASE("Split dotted strings") {
    CHECK(vsn::split_dotted("").empty());
    CHECK(vsn::split_dotted("a").size() == 1);
    CHECK(vsn::split_dotted("a.b.c").size() == 3);
    CHECK(vsn::split_dotted("a.").size() == 2);
    CHECK(vsn::split_dotted(".").size() == 2);
    CHECK(vsn::join_dotted({"x", "y", "z"}) == "x.y.z");
    CHECK(vsn::join_dotted({}) == "");
}

TEST_CASE("Compare prereleases") {
    using vsn::order;
    struct case_ {
        std::string lhs;
        std::string rhs;
        order       expected_ord;
    };

    case_ cases[] = {
        {"foo.bar", "foo.bar", order::equivalent},
        {"foo", "foo", order::equivalent},
        // More identifiers means lesser
        {"foo.bar", "foo", order::less},
        {"foo", "foo.bar", order::greater},
        {"alpha", "", order::less},
        {"", "", order::equivalent},
        {"foo.1", "foo.bar", order::less},
        {"foo.foo", "foo.bar", order::greater},
        {"alpha", "beta", order::less},
        {"alpha.1", "alpha.2", order::less},
        {"alpha.2", "alpha.10", order::less},
        {"rc.01", "rc.1", order::equivalent},
        // Equal numbers continue on to the next identifier
        {"1.alpha", "1.beta", order::less},
    };

    for (auto& [lhs, rhs, exp] : cases) {
        INFO("Comparing prerelease '" << lhs << "' to '" << rhs << "'");
        auto lhs_pre = vsn::prerelease::parse(lhs);
        auto rhs_pre = vsn::prerelease::parse(rhs);
        CHECK(vsn::compare(lhs_pre, rhs_pre) == exp);
        CHECK(vsn::compare(rhs_pre, lhs_pre) == vsn::invert(exp));
    }
}
