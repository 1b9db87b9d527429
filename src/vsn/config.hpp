#pragma once

#include <vsn/util/log.hpp>

namespace vsn::config {

namespace defaults {

/**
 * @brief The log level used when none is given on the command line. Read from the VSN_LOG_LEVEL
 * environment variable, or 'info' if it is unset or does not name a level.
 */
log::level log_level() noexcept;

}  // namespace defaults

using namespace defaults;

}  // namespace vsn::config
