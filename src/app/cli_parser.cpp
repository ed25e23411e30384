#include "cli_parser.hpp"
#include <optional>
#include <system_error>
#include <vector>

namespace hive::app::cli {

    using namespace hive::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> plan_file;
        std::optional<std::string> config_file;
        std::optional<std::string> cwd;
        std::optional<std::string> approve;
        bool verbose = false;
    };

    std::string usage() {
        return "Usage: hive_cli run --plan <file> [--config <file>] [--cwd <dir>] "
               "[--approve auto|interactive] [--verbose]\n"
               "       hive_cli check --plan <file> [--config <file>] [--cwd <dir>] [--verbose]";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return HiveError{ErrorKind::Input, "No command provided.", "missing_command", usage()};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "run") {
            options.command = Command::Run;
        } else if (command == "check") {
            options.command = Command::Check;
        } else {
            return HiveError{ErrorKind::Input, "Unknown command: " + command, "unknown_command", "Supported commands are 'run' and 'check'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--plan") {
                if (i + 1 < args.size()) raw.plan_file = args[++i];
                else return HiveError{ErrorKind::Input, "Missing value for --plan", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return HiveError{ErrorKind::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return HiveError{ErrorKind::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--approve") {
                if (i + 1 < args.size()) raw.approve = args[++i];
                else return HiveError{ErrorKind::Input, "Missing value for --approve", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return HiveError{ErrorKind::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        options.verbose = raw.verbose;

        if (!raw.plan_file.has_value() || raw.plan_file->empty()) {
            return HiveError{ErrorKind::Input, "Must provide --plan", "missing_required_flag", usage()};
        }
        options.plan_file = std::filesystem::path(raw.plan_file.value());

        if (raw.config_file) {
            if (raw.config_file->empty()) {
                return HiveError{ErrorKind::Input, "Empty value for --config", "missing_value"};
            }
            options.config_file = std::filesystem::path(raw.config_file.value());
        }

        if (raw.approve) {
            if (options.command == Command::Check) {
                return HiveError{ErrorKind::Input, "--approve only applies to 'run'", "conflicting_flags"};
            }
            if (raw.approve.value() == "auto") {
                options.approval = ApprovalMode::Auto;
            } else if (raw.approve.value() == "interactive") {
                options.approval = ApprovalMode::Interactive;
            } else {
                return HiveError{ErrorKind::Input, "Invalid value for --approve: " + raw.approve.value(), "invalid_value", "Use 'auto' or 'interactive'."};
            }
        }

        // Path validation
        std::filesystem::path p = raw.cwd ? std::filesystem::path(raw.cwd.value()) : std::filesystem::path(".");
        std::error_code path_ec;
        const bool exists = std::filesystem::exists(p, path_ec);
        if (path_ec || !exists) {
            return HiveError{ErrorKind::Input, "Working directory does not exist or is not a directory", "invalid_path"};
        }

        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return HiveError{ErrorKind::Input, "Working directory does not exist or is not a directory", "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return HiveError{ErrorKind::Input, "Failed to canonicalize working directory", "invalid_path"};
        }
        options.working_directory = std::move(canonical_path);

        return options;
    }

} // namespace hive::app::cli
