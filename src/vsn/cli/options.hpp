#pragma once

#include <vsn/config.hpp>
#include <vsn/util/log.hpp>

#include <string>
#include <vector>

namespace vsn::cli {

/**
 * @brief Top-level vsn subcommands
 */
enum class subcommand {
    _none_,
    parse,
    compare,
    sort,
};

/**
 * @brief Complete aggregate of all vsn command-line options
 */
struct options {
    // The `--log-level` argument
    log::level log_level = config::log_level();

    // The selected subcommand
    enum subcommand subcommand = subcommand::_none_;

    /**
     * @brief Parameters for 'vsn parse'
     */
    struct {
        /// The version strings to parse
        std::vector<std::string> versions;
        /// Whether to print each component on its own line
        bool fields = false;
    } parse;

    /**
     * @brief Parameters for 'vsn compare'
     */
    struct {
        std::string lhs;
        std::string rhs;
    } compare;

    /**
     * @brief Parameters for 'vsn sort'
     */
    struct {
        std::vector<std::string> versions;
        bool                     reverse = false;
    } sort;
};

}  // namespace vsn::cli
