#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/config_loader.hpp"
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "core/logging/logger.hpp"
#include "merge/branch_manager.hpp"
#include "merge/merge_engine.hpp"
#include "merge/region_analyzer.hpp"
#include "mission/mission_manager.hpp"
#include "policy/approval_gate.hpp"
#include "policy/preflight_checker.hpp"
#include "pool/agent_pool.hpp"
#include "quota/quota_tracker.hpp"
#include "runtime/execution_coordinator.hpp"
#include "runtime/plan_loader.hpp"
#include "runtime/pool_model_client.hpp"
#include "runtime/scripted_model_client.hpp"
#include "scheduler/task_scheduler.hpp"
#include "session/event_journal.hpp"
#include "workspace/command_verifier.hpp"
#include "workspace/local_file_system.hpp"
#include "workspace/snapshot_rollback_store.hpp"

namespace {

using hive::core::errors::HiveError;

void report_error(const std::string& what, const HiveError& err) {
    LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

// `check`: impact analysis and preflight of the plan's declared changes.
int run_check(const hive::app::cli::CliOptions& options, const hive::app::HiveConfig& config,
              const hive::runtime::LoadedPlan& loaded) {
    hive::workspace::LocalFileSystem files(options.working_directory);
    hive::policy::WorkspacePreflightChecker preflight(files, config.preflight.protected_paths);

    auto analysis = preflight.analyze(loaded.plan.changes);
    if (hive::core::errors::is_error(analysis)) {
        report_error("Impact analysis failed", hive::core::errors::get_error(analysis));
        return 1;
    }
    LOG_INFO("Impact: " + hive::core::errors::get_value(analysis).summary);

    auto checked = preflight.check("check", loaded.plan.changes);
    if (hive::core::errors::is_error(checked)) {
        report_error("Preflight failed", hive::core::errors::get_error(checked));
        return 1;
    }
    const auto& report = hive::core::errors::get_value(checked);
    for (const auto& warning : report.warnings) {
        LOG_WARN("Preflight warning: " + warning);
    }
    for (const auto& error : report.errors) {
        LOG_ERROR("Preflight error: " + error);
    }
    LOG_INFO(std::string("Plan ") + (report.can_proceed ? "can" : "cannot") + " proceed (" +
             std::to_string(loaded.plan.tasks.size()) + " tasks)");
    return report.can_proceed ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Generate a unique Run ID for this execution
    const std::string run_id = hive::core::config::generate_id("run");

    // 2. Register the Run ID with the Global Logger
    hive::core::logging::Logger::get().set_context_id(run_id);

    // 3. Parse CLI input and return normalized input errors
    LOG_INFO("hive: Bootstrapping...");
    auto parsed = hive::app::cli::parse_and_validate(argc, argv);
    if (hive::core::errors::is_error(parsed)) {
        report_error("Input error", hive::core::errors::get_error(parsed));
        return 2;
    }
    const auto& options = hive::core::errors::get_value(parsed);

    // 4. Configuration and plan
    hive::app::HiveConfig config;
    if (options.config_file.has_value()) {
        auto loaded_config = hive::app::load_config(options.config_file.value());
        if (hive::core::errors::is_error(loaded_config)) {
            report_error("Config error", hive::core::errors::get_error(loaded_config));
            return 2;
        }
        config = hive::core::errors::get_value(loaded_config);
    }
    hive::core::logging::Logger::get().set_min_level(
        options.verbose ? hive::core::logging::LogLevel::DEBUG : config.logging.level);

    auto plan_result = hive::runtime::load_plan(options.plan_file);
    if (hive::core::errors::is_error(plan_result)) {
        report_error("Plan error", hive::core::errors::get_error(plan_result));
        return 2;
    }
    hive::runtime::LoadedPlan loaded = hive::core::errors::get_value(plan_result);

    if (options.command == hive::app::cli::Command::Check) {
        return run_check(options, config, loaded);
    }

    // 5. Wire the components
    // The journal outlives every component that may publish into it.
    std::unique_ptr<hive::session::EventJournal> journal;
    hive::protocol::FanoutEventSink events;
    if (config.journal.enabled) {
        journal = std::make_unique<hive::session::EventJournal>(options.working_directory, run_id,
                                                                config.journal.directory);
        events.add(*journal);
        auto started = journal->write_record(
            "run.started", nlohmann::json{{"plan", options.plan_file.string()},
                                          {"mission", loaded.mission.title},
                                          {"tasks", loaded.plan.tasks.size()}});
        if (hive::core::errors::is_error(started)) {
            report_error("Failed to write journal", hive::core::errors::get_error(started));
            return 6;
        }
    }

    hive::workspace::LocalFileSystem files(options.working_directory);
    hive::workspace::SnapshotRollbackStore rollback(files, config.rollback.max_points_per_mission);
    hive::scheduler::TaskScheduler tasks(events, config.scheduler);
    hive::quota::QuotaTracker quota(events, config.quota);

    hive::runtime::ScriptedModelClient model("scripted", config.model.latency);
    hive::runtime::register_responses(loaded, model);
    hive::pool::AgentPool agents(model, quota, events, config.pool);

    hive::mission::MissionManager missions(tasks, rollback, events);
    hive::merge::BranchManager branches(files, events);
    hive::runtime::PoolModelClient merge_model(agents);
    hive::merge::MergeEngine merges(branches, hive::merge::RegionAnalyzer(), events, &merge_model,
                                    config.merge);

    hive::policy::WorkspacePreflightChecker preflight(files, config.preflight.protected_paths);
    std::unique_ptr<hive::protocol::Verifier> verifier;
    if (config.verification.command.has_value()) {
        verifier = std::make_unique<hive::workspace::CommandVerifier>(
            options.working_directory, config.verification.command.value(),
            config.verification.timeout);
    } else {
        verifier = std::make_unique<hive::workspace::PassThroughVerifier>();
    }
    std::unique_ptr<hive::protocol::ApprovalGate> approval;
    if (options.approval == hive::app::cli::ApprovalMode::Interactive) {
        approval = std::make_unique<hive::policy::ConsoleApprovalGate>(std::cin, std::cout);
        config.coordinator.require_approval = true;
    } else {
        approval = std::make_unique<hive::policy::AutoApprovalGate>();
    }

    hive::runtime::ExecutionCoordinator coordinator(
        hive::runtime::Collaborators{missions, tasks, agents, branches, merges, preflight,
                                     *verifier, rollback, *approval, files, events},
        config.coordinator);

    // 6. Create and execute the mission
    auto created = missions.create(loaded.mission);
    if (hive::core::errors::is_error(created)) {
        report_error("Failed to create mission", hive::core::errors::get_error(created));
        return 4;
    }
    loaded.plan.mission_id = hive::core::errors::get_value(created).id;
    LOG_INFO("Mission " + loaded.plan.mission_id + " created: " + loaded.mission.title);

    auto execution = coordinator.execute(loaded.plan);
    agents.shutdown();

    int exit_code = 0;
    std::string status = "completed";
    std::string summary;
    std::optional<std::string> error_message;
    if (hive::core::errors::is_error(execution)) {
        const auto& err = hive::core::errors::get_error(execution);
        const bool was_cancelled = err.kind == hive::core::errors::ErrorKind::Cancelled;
        report_error(was_cancelled ? "Mission cancelled" : "Mission failed", err);
        exit_code = was_cancelled ? 3 : 1;
        status = was_cancelled ? "cancelled" : "failed";
        summary = "Mission " + loaded.plan.mission_id + " " + status + ".";
        error_message = err.message;
    } else {
        const auto& result = hive::core::errors::get_value(execution);
        summary = std::to_string(result.tasks_completed) + " task(s) completed, " +
                  std::to_string(result.changes.size()) + " file change(s) merged, " +
                  std::to_string(result.merge.conflicts_resolved) + " conflict(s) resolved in " +
                  std::to_string(result.duration.count()) + "ms";
        for (const auto& change : result.changes) {
            LOG_INFO("  " + hive::protocol::to_string(change.type) + " " + change.path);
        }
        if (result.verification.has_value()) {
            LOG_INFO("Verification: " + result.verification->summary);
        }
    }
    LOG_INFO("Run summary: " + summary);

    if (journal) {
        auto exported = missions.export_mission(loaded.plan.mission_id);
        if (!hive::core::errors::is_error(exported)) {
            auto recorded = journal->write_record("mission.final",
                                                  hive::core::errors::get_value(exported));
            if (hive::core::errors::is_error(recorded)) {
                report_error("Failed to write journal", hive::core::errors::get_error(recorded));
                return 6;
            }
        }
        auto final_record = journal->write_final(status, summary, error_message);
        if (hive::core::errors::is_error(final_record)) {
            report_error("Failed to write journal", hive::core::errors::get_error(final_record));
            return 6;
        }
        if (journal->first_error().has_value()) {
            report_error("Journal incomplete", journal->first_error().value());
            return 6;
        }
        LOG_INFO("Journal: " + hive::core::errors::get_value(final_record).string());
    }

    return exit_code;
}
