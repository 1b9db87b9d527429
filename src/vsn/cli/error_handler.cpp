#include "./error_handler.hpp"

#include "./args.hpp"

#include <vsn/error/errors.hpp>
#include <vsn/util/log.hpp>
#include <vsn/version.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>

#include <iostream>
#include <sstream>
#include <system_error>

using namespace vsn;

namespace {

std::string diag_string(const boost::leaf::verbose_diagnostic_info& diag) {
    std::ostringstream strm;
    strm << diag;
    return strm.str();
}

auto handlers = std::tuple(  //
    [](const cli::help_request&, cli::subcommand cmd) {
        fmt::print(std::cout, "{}", cli::help_string(cmd));
        return 0;
    },
    [](const cli::usage_error&    exc,
       cli::subcommand            cmd,
       cli::e_arg_spelling const* spelling,
       cli::e_arg_value const*    value) {
        fmt::print(std::cerr, "{}\n", cli::usage_string(cmd));
        if (spelling && value) {
            fmt::print(std::cerr,
                       "Invalid value '{}' given for '{}'\n",
                       value->value,
                       spelling->value);
        } else if (spelling) {
            fmt::print(std::cerr, "{}: \"{}\"\n", exc.what(), spelling->value);
        } else {
            fmt::print(std::cerr, "Error: {}\n", exc.what());
        }
        return 2;
    },
    [](const vsn::invalid_version& exc,
       e_version_string            given,
       e_compare_operand const*    operand) {
        if (operand) {
            vsn_log(error, "Invalid {} version string '{}'", operand->value, given.value);
        } else {
            vsn_log(error, "Invalid version string '{}'", given.value);
        }
        vsn_log(error, "  Error: {} ({})", exc.reason(), errc_name(exc.kind()));
        return 1;
    },
    [](const vsn::invalid_version& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        vsn_log(error, "{}", exc.what());
        vsn_log(debug, "Additional diagnostic details:\n{}", diag_string(diag));
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        vsn_log(critical,
                "An unhandled std::system_error arose. THIS IS A VSN BUG! Info: {}",
                diag_string(diag));
        vsn_log(critical, "Exception message from std::system_error: {}", exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        vsn_log(critical, "An unhandled error arose. THIS IS A VSN BUG! Info: {}", diag_string(diag));
        return 42;
    });
}  // namespace

int vsn::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
