#include "./ident.hpp"

#include <charconv>

using namespace vsn;

namespace {

bool is_ascii_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_ascii_digit(char c) noexcept { return c >= '0' && c <= '9'; }

}  // namespace

std::string vsn::sanitize_ident(std::string_view token, sanitize_mode mode) {
    std::string out;
    out.reserve(token.size());

    bool any_letter = false;
    bool any_digit  = false;
    bool any_hyphen = false;
    for (char c : token) {
        if (is_ascii_alpha(c)) {
            any_letter = true;
        } else if (is_ascii_digit(c)) {
            any_digit = true;
        } else if (c == '-') {
            any_hyphen = true;
        } else {
            continue;
        }
        out.push_back(c);
    }

    if (mode == sanitize_mode::numeric && any_digit && !any_letter && !any_hyphen) {
        auto first_nonzero = out.find_first_not_of('0');
        if (first_nonzero == std::string::npos) {
            // All zeros
            out = "0";
        } else {
            out.erase(0, first_nonzero);
        }
    }
    return out;
}

std::optional<std::int64_t> vsn::ident_integer(std::string_view id) noexcept {
    if (id.empty()) {
        return std::nullopt;
    }
    const auto   str_end = id.data() + id.size();
    std::int64_t value   = 0;
    auto         res     = std::from_chars(id.data(), str_end, value);
    if (res.ec != std::errc{} || res.ptr != str_end) {
        return std::nullopt;
    }
    return value;
}

ident_kind vsn::classify_ident(std::string_view id) noexcept {
    return ident_integer(id).has_value() ? ident_kind::numeric : ident_kind::alphanumeric;
}

order vsn::compare_idents(std::string_view lhs, std::string_view rhs) noexcept {
    if (classify_ident(lhs) == ident_kind::numeric && classify_ident(rhs) == ident_kind::numeric) {
        auto lhs_num = *ident_integer(lhs);
        auto rhs_num = *ident_integer(rhs);
        if (lhs_num < rhs_num) {
            return order::less;
        } else if (lhs_num > rhs_num) {
            return order::greater;
        }
        // Same value, possibly spelled differently ("-0" and "0"). Keep scanning.
        return order::equivalent;
    }
    auto comp = lhs.compare(rhs);
    if (comp == 0) {
        return order::equivalent;
    } else if (comp < 0) {
        return order::less;
    } else {
        return order::greater;
    }
}
