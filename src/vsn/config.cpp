#include "./config.hpp"

#include <cstdlib>

vsn::log::level vsn::config::defaults::log_level() noexcept {
    auto env = std::getenv("VSN_LOG_LEVEL");
    if (!env) {
        return log::level::info;
    }
    return log::parse_level(env).value_or(log::level::info);
}
