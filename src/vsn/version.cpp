#include "./version.hpp"

#include <array>
#include <charconv>
#include <tuple>

using namespace vsn;

namespace {

struct version_parts {
    std::string_view numbers;
    std::string_view prerelease;
    std::string_view metadata;
};

version_parts split_version_string(std::string_view s) noexcept {
    version_parts ret;
    auto          plus_pos = s.find(metadata_marker);
    auto          head     = s.substr(0, plus_pos);
    if (plus_pos != s.npos) {
        ret.metadata = s.substr(plus_pos + metadata_marker.size());
    }
    auto dash_pos = head.find('-');
    ret.numbers   = head.substr(0, dash_pos);
    if (dash_pos != head.npos) {
        ret.prerelease = head.substr(dash_pos + 1);
    }
    return ret;
}

std::array<std::int64_t, 3> parse_numbers(std::string_view full, std::string_view nums) {
    auto fail = [&](std::string reason) {
        return invalid_version(std::string(full), version_errc::illegal_format, reason);
    };

    auto parts = split_dotted(nums);
    if (parts.empty()) {
        throw fail("missing version number");
    }
    if (parts.size() > 3) {
        throw fail("expected at most three numeric components, got "
                   + std::to_string(parts.size()));
    }

    std::array<std::int64_t, 3> ret = {1, 0, 0};
    auto                        out = ret.begin();
    for (auto part : parts) {
        const auto   part_end = part.data() + part.size();
        std::int64_t n        = 0;
        auto         fc_res   = std::from_chars(part.data(), part_end, n);
        if (fc_res.ec == std::errc::result_out_of_range) {
            throw fail("numeric component '" + std::string(part) + "' is out-of-range");
        }
        if (part.empty() || fc_res.ec != std::errc{} || fc_res.ptr != part_end) {
            throw fail("numeric component '" + std::string(part) + "' is not an integer");
        }
        if (n < 0) {
            throw fail("numeric component '" + std::string(part) + "' is negative");
        }
        *out++ = n;
    }
    return ret;
}

}  // namespace

std::string_view vsn::errc_name(version_errc e) noexcept {
    switch (e) {
    case version_errc::illegal_format:
        return "illegal-format";
    }
    return "unknown";
}

version::version(std::int64_t                     major,
                 std::int64_t                     minor,
                 std::int64_t                     patch,
                 const std::vector<std::string>& tokens)
    : _major(major < 0 ? 0 : major)
    , _minor(minor < 0 ? 0 : minor)
    , _patch(patch < 0 ? 0 : patch) {
    bool in_prerelease = true;
    for (auto& tok : tokens) {
        if (in_prerelease) {
            if (tok == metadata_marker) {
                in_prerelease = false;
                continue;
            }
            _prerelease.add_ident(tok);
        } else {
            _build_metadata.add_ident(tok);
        }
    }
}

version version::parse(std::string_view s) {
    auto parts = split_version_string(s);
    auto nums  = parse_numbers(s, parts.numbers);

    std::vector<std::string> tokens;
    for (auto tok : split_dotted(parts.prerelease)) {
        tokens.emplace_back(tok);
    }
    if (!parts.metadata.empty()) {
        tokens.emplace_back(metadata_marker);
        for (auto tok : split_dotted(parts.metadata)) {
            tokens.emplace_back(tok);
        }
    }
    return version(nums[0], nums[1], nums[2], tokens);
}

bool version::less(const version& other) const noexcept {
    return compare(*this, other) == order::less;
}

std::string version::to_string() const noexcept {
    auto ret = std::to_string(_major) + "." + std::to_string(_minor) + "."
        + std::to_string(_patch);
    if (!_prerelease.empty()) {
        ret += "-" + _prerelease.to_string();
    }
    if (!_build_metadata.empty()) {
        ret += std::string(metadata_marker) + _build_metadata.to_string();
    }
    return ret;
}

order vsn::compare(const version& lhs, const version& rhs) noexcept {
    auto lhs_tup = std::tuple(lhs.major(), lhs.minor(), lhs.patch());
    auto rhs_tup = std::tuple(rhs.major(), rhs.minor(), rhs.patch());
    if (lhs_tup < rhs_tup) {
        return order::less;
    } else if (lhs_tup > rhs_tup) {
        return order::greater;
    }
    // Build metadata is never considered
    return compare(lhs.prerelease(), rhs.prerelease());
}
