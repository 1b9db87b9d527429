#include "../options.hpp"

#include <vsn/error/errors.hpp>
#include <vsn/util/log.hpp>
#include <vsn/version.hpp>

#include <boost/leaf/on_error.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <iostream>

namespace vsn::cli::cmd {

namespace {

version parse_operand(std::string_view side, const std::string& str) {
    auto load_info = boost::leaf::on_error(e_compare_operand{std::string(side)},
                                           e_version_string{str});
    return version::parse(str);
}

std::string_view order_name(order o) noexcept {
    switch (o) {
    case order::less:
        return "less";
    case order::equivalent:
        return "equivalent";
    case order::greater:
        return "greater";
    }
    return "?";
}

}  // namespace

int compare(const options& opts) {
    auto lhs = parse_operand("left-hand", opts.compare.lhs);
    auto rhs = parse_operand("right-hand", opts.compare.rhs);
    auto ord = vsn::compare(lhs, rhs);
    vsn_log(debug, "Compared {} to {}", lhs.to_string(), rhs.to_string());
    fmt::print(std::cout, "{}\n", order_name(ord));
    return 0;
}

}  // namespace vsn::cli::cmd
