#pragma once

#include "./options.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace vsn::cli {

/// Thrown when `--help` or `-h` appears on the command line
struct help_request : std::exception {};

/// The command line could not be understood
struct usage_error : std::runtime_error {
    using runtime_error::runtime_error;
};

/// The argument that caused a usage_error, as it was spelled on the command line
struct e_arg_spelling {
    std::string value;
};

/// The value that an option rejected
struct e_arg_value {
    std::string value;
};

/**
 * @brief Fill `opts` from the command-line arguments (not including the program name).
 *
 * The subcommand is always taken from `argv`, never from an earlier read. `--log-level` may
 * appear before or after the subcommand. Everything after the subcommand that does not look like
 * an option is one of its positional values.
 *
 * Errors are thrown as Boost.LEAF exceptions: either a help_request or a usage_error, the latter
 * usually with an e_arg_spelling. Both carry the subcommand that had been selected when the error
 * occurred.
 */
void read_args(options& opts, const std::vector<std::string>& argv);

/// One-line usage summary for the given subcommand, or for vsn as a whole given `_none_`
std::string usage_string(subcommand) noexcept;

/// Full help text for the given subcommand, or for vsn as a whole given `_none_`
std::string help_string(subcommand) noexcept;

}  // namespace vsn::cli
