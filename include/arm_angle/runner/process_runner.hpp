#pragma once

#include <string>
#include <vector>

namespace arm_angle::runner {

struct ProcessResult {
    bool started = false;
    bool timed_out = false;
    bool crashed = false;
    int exit_code = -1;
    double duration_ms = 0.0;
    std::string output;         // merged stdout/stderr
    std::string error_message;  // set when the process could not be started
};

// Runs one external command to completion, bounded by a wall-clock timeout.
// On timeout only this child is killed.
class ProcessRunner {
public:
    explicit ProcessRunner(int start_timeout_ms = 5000);

    ProcessResult run(const std::vector<std::string>& argv, int timeout_ms,
                      const std::string& cwd = std::string()) const;

private:
    int start_timeout_ms_;
};

// Last `max_chars` characters of `text`, trimmed to whole lines when possible.
std::string tail_text(const std::string& text, size_t max_chars);

} // namespace arm_angle::runner
