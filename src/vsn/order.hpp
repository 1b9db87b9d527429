#pragma once

namespace vsn {

/**
 * @brief The result of a three-way comparison between two version components
 */
enum class order {
    less,
    equivalent,
    greater,
};

constexpr order invert(order o) noexcept {
    switch (o) {
    case order::less:
        return order::greater;
    case order::greater:
        return order::less;
    case order::equivalent:
        break;
    }
    return order::equivalent;
}

}  // namespace vsn
