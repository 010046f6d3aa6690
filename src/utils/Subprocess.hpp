#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace Cadenza {
    struct ProcessResult {
        int exit_code = -1;
        std::string out;
        std::string err;
        bool timed_out = false;
        bool truncated = false;
        std::string spawn_error; // non-empty when the program could not be started
    };

    // Runs argv[0] (looked up in PATH) with no shell, capturing stdout/stderr.
    // The child is killed once `timeout` elapses; output beyond max_output_bytes is discarded.
    ProcessResult RunProcess(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t max_output_bytes = 16 * 1024 * 1024);
}
