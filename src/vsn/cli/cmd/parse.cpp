#include "../options.hpp"

#include <vsn/error/errors.hpp>
#include <vsn/util/log.hpp>
#include <vsn/version.hpp>

#include <boost/leaf/on_error.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <iostream>

namespace vsn::cli::cmd {

int parse(const options& opts) {
    for (auto& str : opts.parse.versions) {
        auto load_str = boost::leaf::on_error(e_version_string{str});
        auto ver = vsn::version::parse(str);
        vsn_log(debug, "Parsed '{}' as {}", str, ver.to_string());
        if (!opts.parse.fields) {
            fmt::print(std::cout, "{}\n", ver.to_string());
            continue;
        }
        fmt::print(std::cout,
                   "major: {}\nminor: {}\npatch: {}\nprerelease: {}\nmetadata: {}\n",
                   ver.major(),
                   ver.minor(),
                   ver.patch(),
                   ver.prerelease_string(),
                   ver.metadata_string());
    }
    return 0;
}

}  // namespace vsn::cli::cmd
