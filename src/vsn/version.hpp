#pragma once

#include <vsn/build_metadata.hpp>
#include <vsn/prerelease.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace vsn {

/// Separates prerelease tokens from build metadata tokens, both in text and in the token list
/// given to the version constructor.
inline constexpr std::string_view metadata_marker = "+";

/**
 * @brief The kinds of failure that can occur while parsing a version string
 */
enum class version_errc {
    illegal_format,
};

/// Get the spelling of an error kind, eg. "illegal-format"
std::string_view errc_name(version_errc) noexcept;

class invalid_version : public std::runtime_error {
    std::string  _string;
    version_errc _kind;
    std::string  _reason;

public:
    invalid_version(std::string string, version_errc kind, std::string reason)
        : runtime_error("Illegal version format '" + string + "': " + reason)
        , _string(std::move(string))
        , _kind(kind)
        , _reason(std::move(reason)) {}

    auto& string() const noexcept { return _string; }
    auto  kind() const noexcept { return _kind; }
    auto& reason() const noexcept { return _reason; }
};

class version;
order              compare(const version& lhs, const version& rhs) noexcept;
inline std::string to_string(const version& ver) noexcept;

/**
 * @brief An immutable version number: major.minor.patch[-prerelease][+metadata]
 */
class version {
    std::int64_t        _major = 1;
    std::int64_t        _minor = 0;
    std::int64_t        _patch = 0;
    vsn::prerelease     _prerelease;
    vsn::build_metadata _build_metadata;

public:
    /**
     * @brief Construct a version from its numbers and a flat list of identifier tokens.
     *
     * Negative numbers are clamped to zero. Tokens before the first metadata_marker become
     * prerelease identifiers, tokens after it become build metadata. Every token is sanitized
     * (see sanitize_ident()), and tokens that sanitize to nothing are dropped.
     */
    version(std::int64_t                     major,
            std::int64_t                     minor,
            std::int64_t                     patch,
            const std::vector<std::string>& tokens = {});

    /**
     * @brief Parse a version string.
     *
     * The numeric part may have one, two, or three components, each fitting a signed 64-bit integer. Missing components default to
     * 1.0.0 (eg. "5" is 5.0.0). Throws invalid_version if the numeric part cannot be decoded.
     */
    static version parse(std::string_view s);

    std::int64_t major() const noexcept { return _major; }
    std::int64_t minor() const noexcept { return _minor; }
    std::int64_t patch() const noexcept { return _patch; }

    auto& prerelease() const noexcept { return _prerelease; }
    auto& build_metadata() const noexcept { return _build_metadata; }

    std::string prerelease_string() const noexcept { return _prerelease.to_string(); }
    std::string metadata_string() const noexcept { return _build_metadata.to_string(); }

    bool is_prerelease() const noexcept { return !_prerelease.empty(); }

    /// Determine whether this version has lower precedence than `other`
    bool less(const version& other) const noexcept;

    std::string to_string() const noexcept;

#define DEF_OP(op, expr)                                                                           \
    inline friend bool operator op(const version& lhs, const version& rhs) noexcept {              \
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

inline std::string to_string(const version& ver) noexcept { return ver.to_string(); }

}  // namespace vsn
