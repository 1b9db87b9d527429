#include <vsn/cli/dispatch_main.hpp>
#include <vsn/util/log.hpp>

#include <neo/event.hpp>

#include <string>
#include <vector>

int main(int argc, char** argv) {
    vsn::log::init_logger();
    neo::listener log_listener = &vsn::log::ev_log::print;

    const std::vector<std::string> args(argv + 1, argv + argc);
    return vsn::cli::run(args);
}
