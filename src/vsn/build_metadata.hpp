#pragma once

#include <vsn/ident.hpp>
#include <vsn/prerelease.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace vsn {

/**
 * @brief The dot-separated identifiers following a '+' in a version string. These never take part
 * in version ordering.
 */
class build_metadata {
    std::vector<std::string> _ids;

public:
    build_metadata() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    void add_ident(std::string_view raw) {
        auto id = sanitize_ident(raw, sanitize_mode::opaque);
        if (!id.empty()) {
            _ids.push_back(std::move(id));
        }
    }

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const noexcept { return join_dotted(_ids); }

    static build_metadata parse(std::string_view s) {
        build_metadata ret;
        for (auto part : split_dotted(s)) {
            ret.add_ident(part);
        }
        return ret;
    }

    friend bool operator==(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return lhs._ids == rhs._ids;
    }
    friend bool operator!=(const build_metadata& lhs, const build_metadata& rhs) noexcept {
        return !(lhs == rhs);
    }
};

}  // namespace vsn
