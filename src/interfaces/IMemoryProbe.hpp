#pragma once
#include <optional>

namespace Cadenza {

class IMemoryProbe {
public:
    virtual ~IMemoryProbe() = default;
    // Fraction of host memory in use, in [0, 1]. nullopt when it cannot be read.
    virtual std::optional<double> UsedRatio() = 0;
};

}

