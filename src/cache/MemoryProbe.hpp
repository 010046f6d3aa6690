#pragma once
#include <string>
#include "../interfaces/IMemoryProbe.hpp"

namespace Cadenza {
    // Host memory in use, from MemTotal and MemAvailable in /proc/meminfo.
    class ProcMemoryProbe : public IMemoryProbe {
    public:
        explicit ProcMemoryProbe(std::string path = "/proc/meminfo");
        std::optional<double> UsedRatio() override;

        // Parses meminfo-formatted text.
        static std::optional<double> ParseUsedRatio(const std::string& meminfo);

    private:
        std::string path_;
    };
}
