#pragma once

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace vsn::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

/**
 * @brief A log record. Emitted as an event, and printed by whoever is listening.
 */
struct ev_log {
    log::level       level;
    std::string_view message;

    void print() const noexcept;
};

void log_print(level l, std::string_view s) noexcept;
void log_emit(ev_log) noexcept;

void init_logger() noexcept;

/// Parse a level name as given on the command line or in the environment
std::optional<level> parse_level(std::string_view) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        auto message = fmt::vformat(s, fmt::make_format_args(args...));
        log_emit(ev_log{l, message});
    }
}

#define vsn_log(Level, str, ...)                                                                   \
    do {                                                                                           \
        if (::vsn::log::level_enabled(::vsn::log::level::Level)) {                                 \
            ::vsn::log::log(::vsn::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);             \
        }                                                                                          \
    } while (0)

}  // namespace vsn::log
