#include "./args.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <fmt/format.h>

#include <optional>
#include <string_view>

using namespace vsn;
using namespace vsn::cli;

using strv = std::string_view;

namespace {

[[noreturn]] void fail(strv what, strv spelling) {
    throw boost::leaf::exception(usage_error(std::string(what)),
                                 e_arg_spelling{std::string(spelling)});
}

bool looks_like_option(strv arg) noexcept { return arg.size() > 1 && arg[0] == '-'; }

class arg_cursor {
    const std::vector<std::string>& _argv;
    std::size_t                     _idx = 0;

public:
    explicit arg_cursor(const std::vector<std::string>& argv) noexcept
        : _argv(argv) {}

    bool at_end() const noexcept { return _idx == _argv.size(); }
    strv take() noexcept { return _argv[_idx++]; }

    /**
     * @brief If `arg` is the option `--<long_name>` or `-<short_name>`, return its value.
     *
     * The value may be attached (`--name=value`, `-svalue`) or be the following argument, which
     * is consumed.
     */
    std::optional<std::string> option_value(strv arg, strv long_name, strv short_name) {
        strv attached;
        if (arg.starts_with("--")) {
            auto tail = arg.substr(2);
            if (!tail.starts_with(long_name)) {
                return std::nullopt;
            }
            attached = tail.substr(long_name.size());
            if (!attached.empty() && attached[0] != '=') {
                return std::nullopt;
            }
            if (!attached.empty()) {
                return std::string(attached.substr(1));
            }
        } else if (arg.starts_with("-") && arg.substr(1).starts_with(short_name)) {
            attached = arg.substr(1 + short_name.size());
            if (!attached.empty()) {
                return std::string(attached);
            }
        } else {
            return std::nullopt;
        }
        if (at_end()) {
            fail("Expected a value", arg);
        }
        return std::string(take());
    }
};

/// Check for a switch, which never takes a value
bool is_switch(strv arg, strv long_name, strv short_name) {
    if (arg.starts_with("--")) {
        auto tail = arg.substr(2);
        if (tail.starts_with(long_name) && tail.size() > long_name.size()
            && tail[long_name.size()] == '=') {
            fail("Argument does not expect a value", fmt::format("--{}", long_name));
        }
        return tail == long_name;
    }
    return !short_name.empty() && arg.starts_with("-") && arg.substr(1) == short_name;
}

log::level read_log_level(const std::string& given) {
    auto lvl = log::parse_level(given);
    if (!lvl) {
        throw boost::leaf::exception(usage_error("Invalid log level"),
                                     e_arg_spelling{"--log-level"},
                                     e_arg_value{given});
    }
    return *lvl;
}

subcommand read_subcommand(strv arg) {
    if (arg == "parse") {
        return subcommand::parse;
    } else if (arg == "compare") {
        return subcommand::compare;
    } else if (arg == "sort") {
        return subcommand::sort;
    }
    fail(looks_like_option(arg) ? "Unrecognized argument" : "Unrecognized subcommand", arg);
}

void bind_positionals(options& opts, std::vector<std::string> values) {
    switch (opts.subcommand) {
    case subcommand::parse:
        if (values.empty()) {
            throw boost::leaf::exception(usage_error("Expected at least one <version>"));
        }
        opts.parse.versions = std::move(values);
        return;
    case subcommand::compare:
        if (values.size() < 2) {
            throw boost::leaf::exception(usage_error("Expected both <lhs> and <rhs>"));
        }
        if (values.size() > 2) {
            fail("Unexpected argument", values[2]);
        }
        opts.compare.lhs = std::move(values[0]);
        opts.compare.rhs = std::move(values[1]);
        return;
    case subcommand::sort:
        opts.sort.versions = std::move(values);
        return;
    case subcommand::_none_:
        break;
    }
    throw boost::leaf::exception(usage_error("Expected a subcommand"));
}

}  // namespace

void cli::read_args(options& opts, const std::vector<std::string>& argv) {
    opts.subcommand = subcommand::_none_;
    auto load_cmd   = boost::leaf::on_error([&] { return opts.subcommand; });

    arg_cursor               args{argv};
    std::vector<std::string> positionals;
    while (!args.at_end()) {
        auto arg = args.take();
        if (arg == "--help" || arg == "-h") {
            throw boost::leaf::exception(help_request());
        }
        if (auto level = args.option_value(arg, "log-level", "l")) {
            opts.log_level = read_log_level(*level);
            continue;
        }
        if (opts.subcommand == subcommand::_none_) {
            opts.subcommand = read_subcommand(arg);
            continue;
        }
        if (!looks_like_option(arg)) {
            positionals.emplace_back(arg);
        } else if (opts.subcommand == subcommand::parse && is_switch(arg, "fields", "")) {
            opts.parse.fields = true;
        } else if (opts.subcommand == subcommand::sort && is_switch(arg, "reverse", "r")) {
            opts.sort.reverse = true;
        } else {
            fail("Unrecognized argument", arg);
        }
    }
    bind_positionals(opts, std::move(positionals));
}

std::string cli::usage_string(subcommand cmd) noexcept {
    switch (cmd) {
    case subcommand::parse:
        return "Usage: vsn parse [--fields] <version> [<version> [...]]";
    case subcommand::compare:
        return "Usage: vsn compare <lhs> <rhs>";
    case subcommand::sort:
        return "Usage: vsn sort [--reverse] [<version> [...]]";
    case subcommand::_none_:
        break;
    }
    return "Usage: vsn [--log-level=<level>] {parse,compare,sort} ...";
}

std::string cli::help_string(subcommand cmd) noexcept {
    std::string_view body;
    switch (cmd) {
    case subcommand::parse:
        body = "Parse version strings and print their canonical form.\n"
               "\n"
               "--fields\n"
               "  Print each component of the version on its own line\n";
        break;
    case subcommand::compare:
        body = "Compare the precedence of two versions. Prints 'less', 'equivalent', or\n"
               "'greater', describing <lhs> relative to <rhs>.\n";
        break;
    case subcommand::sort:
        body = "Sort versions from lowest to highest precedence. Versions of equal precedence\n"
               "keep the order they were given in.\n"
               "\n"
               "--reverse, -r\n"
               "  Print the highest version first\n";
        break;
    case subcommand::_none_:
        body = "Parse, compare, and sort version strings.\n"
               "\n"
               "--log-level=<level>, -l <level>\n"
               "  One of 'trace', 'debug', 'info', 'warn', 'error', 'critical', or 'silent'.\n"
               "  The default is taken from the VSN_LOG_LEVEL environment variable.\n"
               "\n"
               "Subcommands:\n"
               "  parse     Parse version strings and print their canonical form\n"
               "  compare   Compare the precedence of two versions\n"
               "  sort      Sort versions from lowest to highest precedence\n";
        break;
    }
    return fmt::format("{}\n\n{}", usage_string(cmd), body);
}
