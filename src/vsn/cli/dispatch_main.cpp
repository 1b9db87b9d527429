#include "./dispatch_main.hpp"

#include "./args.hpp"
#include "./error_handler.hpp"
#include "./options.hpp"

#include <boost/leaf/on_error.hpp>
#include <neo/assert.hpp>

using namespace vsn;

namespace vsn::cli {

namespace cmd {
using command = int(const options&);

command parse;
command compare;
command sort;

}  // namespace cmd

namespace {

int dispatch(const options& opts) {
    auto load_cmd = boost::leaf::on_error(opts.subcommand);
    switch (opts.subcommand) {
    case subcommand::parse:
        return cmd::parse(opts);
    case subcommand::compare:
        return cmd::compare(opts);
    case subcommand::sort:
        return cmd::sort(opts);
    case subcommand::_none_:;
    }
    neo_assert_always(invariant, false, "No subcommand was selected", int(opts.subcommand));
}

}  // namespace

int dispatch_main(const options& opts) noexcept {
    return vsn::handle_cli_errors([&] { return dispatch(opts); });
}

int run(const std::vector<std::string>& argv) noexcept {
    options opts;
    return vsn::handle_cli_errors([&] {
        read_args(opts, argv);
        log::current_log_level = opts.log_level;
        return dispatch(opts);
    });
}

}  // namespace vsn::cli
