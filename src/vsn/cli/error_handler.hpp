#pragma once

#include <functional>

namespace vsn {

/**
 * @brief Invoke the given function, translating any error it raises into log output and an exit
 * code: 0 for a help request, 1 for a bad version string, 2 for a bad command line, and 42 for
 * anything unexpected.
 */
int handle_cli_errors(std::function<int()>) noexcept;

}  // namespace vsn
