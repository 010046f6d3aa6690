#include "Errors.hpp"

namespace Cadenza {

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out.empty() ? std::string("none") : out;
}

}
