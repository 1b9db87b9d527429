#pragma once

#include <vsn/ident.hpp>
#include <vsn/order.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vsn {

class prerelease;
order compare(const prerelease& lhs, const prerelease& rhs) noexcept;

/**
 * @brief The dot-separated identifiers following a '-' in a version string
 */
class prerelease {
    std::vector<std::string> _ids;

public:
    prerelease() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    /**
     * @brief Sanitize the given token in numeric mode and append it. Tokens that sanitize to an
     * empty string are dropped.
     */
    void add_ident(std::string_view raw);

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const noexcept;

    /**
     * @brief Build a prerelease from a dotted string, eg. "alpha.1". An empty string yields an
     * empty prerelease.
     */
    static prerelease parse(std::string_view str);

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const prerelease& lhs, const prerelease& rhs) noexcept {        \
        auto o = compare(lhs, rhs);                                                                \
        return (expr);                                                                             \
    }                                                                                              \
    static_assert(true)

    DEF_OP(==, (o == order::equivalent));
    DEF_OP(!=, (o != order::equivalent));
    DEF_OP(<, (o == order::less));
    DEF_OP(>, (o == order::greater));
    DEF_OP(<=, (o == order::less || o == order::equivalent));
    DEF_OP(>=, (o == order::greater || o == order::equivalent));
#undef DEF_OP
};

/// Split a string on '.', keeping empty pieces. An empty string yields no pieces.
std::vector<std::string_view> split_dotted(std::string_view s);

/// Join identifiers with '.'
std::string join_dotted(const std::vector<std::string>& ids);

}  // namespace vsn
