#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/hive_errors.hpp"

namespace hive::app::cli {

    enum class Command {
        Run,    // Execute a mission plan end-to-end
        Check   // Impact analysis and preflight only
    };

    enum class ApprovalMode {
        Auto,
        Interactive
    };

    struct CliOptions {
        Command command = Command::Run;
        std::filesystem::path plan_file;
        std::optional<std::filesystem::path> config_file;
        std::filesystem::path working_directory;
        ApprovalMode approval = ApprovalMode::Auto;
        bool verbose = false;
    };

    hive::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
