#include "../options.hpp"

#include <vsn/error/errors.hpp>
#include <vsn/util/log.hpp>
#include <vsn/version.hpp>

#include <boost/leaf/on_error.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iostream>

namespace vsn::cli::cmd {

int sort(const options& opts) {
    struct entry {
        vsn::version ver;
        std::string  given;
    };
    std::vector<entry> entries;
    for (auto& str : opts.sort.versions) {
        auto load_str = boost::leaf::on_error(e_version_string{str});
        entries.push_back(entry{vsn::version::parse(str), str});
    }

    vsn_log(debug, "Sorting {} versions", entries.size());
    std::stable_sort(entries.begin(), entries.end(), [&](const entry& lhs, const entry& rhs) {
        return opts.sort.reverse ? rhs.ver.less(lhs.ver) : lhs.ver.less(rhs.ver);
    });

    for (auto& e : entries) {
        fmt::print(std::cout, "{}\n", e.given);
    }
    return 0;
}

}  // namespace vsn::cli::cmd
