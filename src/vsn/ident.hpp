#pragma once

#include <vsn/order.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vsn {

/**
 * @brief Controls how sanitize_ident() treats a purely-numeric token.
 */
enum class sanitize_mode {
    /// Prerelease context: all-digit tokens have their leading zeros removed
    numeric,
    /// Build metadata context: the token is kept as filtered
    opaque,
};

/**
 * @brief Reduce a raw token to a valid identifier.
 *
 * Every character that is not an ASCII letter, digit, or hyphen is dropped. In `numeric` mode a
 * token made only of digits has its leading zeros removed, collapsing to "0" if nothing else
 * remains. The result may be empty.
 */
std::string sanitize_ident(std::string_view token, sanitize_mode mode);

enum class ident_kind {
    alphanumeric,
    numeric,
};

/**
 * @brief Decide whether an identifier compares as an integer.
 *
 * An identifier is numeric if it is an optional '-' followed by one or more digits and the value
 * fits in a signed 64-bit integer.
 */
ident_kind classify_ident(std::string_view id) noexcept;

/// Get the integral value of a numeric identifier, or nullopt if it has none
std::optional<std::int64_t> ident_integer(std::string_view id) noexcept;

/**
 * @brief Compare two identifiers at the same position of a prerelease.
 *
 * If both are numeric they compare by value, otherwise by bytewise string comparison.
 */
order compare_idents(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace vsn
