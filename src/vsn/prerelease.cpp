#include "./prerelease.hpp"

using namespace vsn;

std::vector<std::string_view> vsn::split_dotted(std::string_view s) {
    std::vector<std::string_view> acc;
    if (s.empty()) {
        return acc;
    }
    auto remaining = s;
    while (true) {
        auto next_dot = remaining.find('.');
        acc.push_back(remaining.substr(0, next_dot));
        if (next_dot == remaining.npos) {
            break;
        }
        remaining = remaining.substr(next_dot + 1);
    }
    return acc;
}

std::string vsn::join_dotted(const std::vector<std::string>& ids) {
    std::string acc;
    auto        it   = ids.cbegin();
    auto        stop = ids.cend();
    while (it != stop) {
        acc += *it;
        ++it;
        if (it != stop) {
            acc += ".";
        }
    }
    return acc;
}

void prerelease::add_ident(std::string_view raw) {
    auto id = sanitize_ident(raw, sanitize_mode::numeric);
    if (!id.empty()) {
        _ids.push_back(std::move(id));
    }
}

std::string prerelease::to_string() const noexcept { return join_dotted(_ids); }

prerelease prerelease::parse(std::string_view s) {
    prerelease ret;
    for (auto part : split_dotted(s)) {
        ret.add_ident(part);
    }
    return ret;
}

order vsn::compare(const prerelease& lhs, const prerelease& rhs) noexcept {
    auto       lhs_iter = lhs.idents().cbegin();
    auto       rhs_iter = rhs.idents().cbegin();
    const auto lhs_end  = lhs.idents().cend();
    const auto rhs_end  = rhs.idents().cend();

    for (; lhs_iter != lhs_end && rhs_iter != rhs_end; ++lhs_iter, ++rhs_iter) {
        auto ord = compare_idents(*lhs_iter, *rhs_iter);
        if (ord != order::equivalent) {
            return ord;
        }
    }
    // Every common identifier matched. The sequence with more identifiers is the lesser one. A
    // version without a prerelease therefore sorts after one that has a prerelease.
    if (lhs_iter != lhs_end) {
        return order::less;
    } else if (rhs_iter != rhs_end) {
        return order::greater;
    } else {
        return order::equivalent;
    }
}
