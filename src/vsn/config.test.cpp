#include "./config.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>

TEST_CASE("Default log level from the environment") {
    ::unsetenv("VSN_LOG_LEVEL");
    CHECK(vsn::config::log_level() == vsn::log::level::info);

    ::setenv("VSN_LOG_LEVEL", "debug", 1);
    CHECK(vsn::config::log_level() == vsn::log::level::debug);

    // Unknown names fall back to the default
    ::setenv("VSN_LOG_LEVEL", "chatty", 1);
    CHECK(vsn::config::log_level() == vsn::log::level::info);

    ::unsetenv("VSN_LOG_LEVEL");
}
