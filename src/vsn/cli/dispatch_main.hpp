#pragma once

#include <string>
#include <vector>

namespace vsn::cli {

struct options;

/// Run the subcommand selected in `opts`, returning the process exit code
int dispatch_main(const options& opts) noexcept;

/**
 * @brief Read the command-line arguments (not including the program name) and run the selected
 * subcommand. Help requests and usage errors are handled here too.
 */
int run(const std::vector<std::string>& argv) noexcept;

}  // namespace vsn::cli
