#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/hive_errors.hpp"

namespace hive::workspace {

struct ProcessRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};  // 0 disables
    std::size_t max_output_bytes = 64 * 1024;  // Per stream; the tail is kept
};

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds duration{0};
};

// Runs `command` through /bin/sh, killing it on timeout or cancellation.
// Only failures to launch are errors; a non-zero exit is reported in the
// outcome.
core::errors::Result<ProcessOutcome> run_process(const ProcessRequest& request,
                                                 const core::concurrency::CancelToken& cancel);

}  // namespace hive::workspace
