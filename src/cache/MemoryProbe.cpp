#include "MemoryProbe.hpp"
#include "../utils/Logger.hpp"
#include <fstream>
#include <sstream>

namespace Cadenza {

ProcMemoryProbe::ProcMemoryProbe(std::string path) : path_(std::move(path)) {}

std::optional<double> ProcMemoryProbe::ParseUsedRatio(const std::string& meminfo) {
    std::istringstream in(meminfo);
    std::string line;
    std::optional<double> total, available, free_kb, buffers, cached;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        double value = 0;
        if (!(fields >> key >> value)) continue;
        if (key == "MemTotal:") total = value;
        else if (key == "MemAvailable:") available = value;
        else if (key == "MemFree:") free_kb = value;
        else if (key == "Buffers:") buffers = value;
        else if (key == "Cached:") cached = value;
    }
    if (!total || *total <= 0) return std::nullopt;
    // Kernels before 3.14 lack MemAvailable.
    if (!available && free_kb) {
        available = *free_kb + buffers.value_or(0) + cached.value_or(0);
    }
    if (!available) return std::nullopt;
    double ratio = 1.0 - (*available / *total);
    if (ratio < 0.0) ratio = 0.0;
    if (ratio > 1.0) ratio = 1.0;
    return ratio;
}

std::optional<double> ProcMemoryProbe::UsedRatio() {
    std::ifstream f(path_);
    if (!f.is_open()) {
        Logger::Log(LogLevel::Debug, "cache", "Could not open " + path_);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return ParseUsedRatio(buffer.str());
}

}
