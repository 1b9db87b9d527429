#pragma once

#include <string>

namespace vsn {

/// The version string that was being handled when an error occurred
struct e_version_string {
    std::string value;
};

/// Which side of a comparison a bad version string was given for
struct e_compare_operand {
    std::string value;
};

}  // namespace vsn
