#include "./log.hpp"

#include <neo/assert.hpp>
#include <neo/event.hpp>

#include <spdlog/spdlog.h>

void vsn::log::init_logger() noexcept { spdlog::set_pattern("[%^%-5l%$] %v"); }

void vsn::log::ev_log::print() const noexcept { log_print(level, message); }

void vsn::log::log_emit(ev_log ev) noexcept { neo::emit(ev); }

void vsn::log::log_print(vsn::log::level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        logger->set_level(spdlog::level::trace);
        return logger;
    }();

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    logger_inst->log(lvl, "{}", msg);
}

std::optional<vsn::log::level> vsn::log::parse_level(std::string_view s) noexcept {
    struct entry {
        std::string_view name;
        level            lvl;
    };
    static constexpr entry names[] = {
        {"trace", level::trace},
        {"debug", level::debug},
        {"info", level::info},
        {"warn", level::warn},
        {"warning", level::warn},
        {"error", level::error},
        {"critical", level::critical},
        {"silent", level::silent},
    };
    for (auto& [name, lvl] : names) {
        if (name == s) {
            return lvl;
        }
    }
    return std::nullopt;
}
