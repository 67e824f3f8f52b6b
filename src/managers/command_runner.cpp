#include "command_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── RunReport ──────────────────────────────────────────────────

size_t RunReport::succeeded_count() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const ExecutionResult& r) { return r.succeeded(); }));
}

std::string RunReport::summary() const {
    return fmt::format("Execution complete: {}/{} commands successful",
                       succeeded_count(), total_commands);
}

// ── SessionGuard ───────────────────────────────────────────────

SessionGuard::SessionGuard(std::unique_ptr<RemoteSession> session)
    : session_(std::move(session)), closed_(false) {
}

SessionGuard::~SessionGuard() {
    close();
}

void SessionGuard::close() {
    if (closed_ || !session_) return;
    closed_ = true;
    session_->close();
    logging::info("SSH connection closed");
}

// ── CommandRunner ──────────────────────────────────────────────

CommandRunner::CommandRunner(Transport& transport, RunnerOptions options)
    : transport_(transport), options_(options) {
}

RunReport CommandRunner::run(const ConnectionParameters& params, const CommandList& commands) {
    RunReport report;
    report.total_commands = commands.size();

    logging::info(fmt::format("Connecting to {}:{} as {}", params.host, params.port, params.username));

    auto conn = transport_.connect(params, [](const std::string& status) {
        logging::debug(status);
    });
    if (!conn.is_ok()) {
        report.connect_failure = conn.failure;
        report.error = fmt::format("{} error: {}", connect_failure_name(conn.failure), conn.error);
        logging::error("Failed to establish SSH connection (" + report.error + ")");
        return report;
    }

    report.connected = true;
    logging::info("SSH connection established successfully");

    SessionGuard session(std::move(conn.session));
    const size_t total = commands.size();

    for (size_t i = 0; i < total; i++) {
        const std::string& command = commands[i];
        if (!session->is_active()) {
            report.aborted = true;
            report.error = "Connection closed by remote host";
            logging::error(fmt::format("Connection lost before command {}/{}; skipping remaining {} commands",
                                       i + 1, total, total - i));
            break;
        }

        logging::info(fmt::format("Executing command {}/{}: {}", i + 1, total, command));

        CommandOutcome outcome = session->run(command);

        if (outcome.kind == OutcomeKind::CONNECTION_LOST) {
            report.aborted = true;
            report.error = outcome.fault;
            logging::error(fmt::format("Connection lost during command {}/{}: {}",
                                       i + 1, total, outcome.fault));
            if (i + 1 < total) {
                logging::error(fmt::format("Skipping remaining {} commands", total - i - 1));
            }
            break;
        }

        ExecutionResult result = (outcome.kind == OutcomeKind::COMPLETED)
            ? ExecutionResult{command, outcome.result.exit_code,
                              outcome.result.stdout_data, outcome.result.stderr_data}
            : ExecutionResult{command, FAILED_COMMAND_EXIT_STATUS, "", outcome.fault};

        log_result(i + 1, total, result, outcome);
        echo_output(result);
        report.results.push_back(std::move(result));

        if (options_.command_delay_ms > 0 && i + 1 < total) {
            platform::sleep_ms(options_.command_delay_ms);
        }
    }

    session.close();

    report.all_succeeded = !report.aborted &&
                           report.succeeded_count() == report.results.size();
    logging::info(report.summary());
    return report;
}

void CommandRunner::log_result(size_t position, size_t total, const ExecutionResult& result,
                               const CommandOutcome& outcome) const {
    if (outcome.kind == OutcomeKind::CHANNEL_FAULT) {
        logging::error(fmt::format("Error executing command {}/{} '{}': {}",
                                   position, total, result.command, outcome.fault));
    } else if (result.succeeded()) {
        logging::info(fmt::format("Command {}/{} executed successfully (exit code: {})",
                                  position, total, result.exit_status));
    } else {
        logging::warning(fmt::format("Command {}/{} failed with exit code: {}",
                                     position, total, result.exit_status));
        logging::error("Command failed: " + result.command);
    }

    // Output of failed commands is shown at the default level
    LogLevel preview = result.succeeded() ? LogLevel::DEBUG : LogLevel::INFO;
    if (!result.stdout_data.empty()) {
        logging::write(preview, "stdout: " + truncate_for_log(result.stdout_data, LOG_OUTPUT_PREVIEW_CHARS));
    }
    if (!result.stderr_data.empty()) {
        logging::write(preview, "stderr: " + truncate_for_log(result.stderr_data, LOG_OUTPUT_PREVIEW_CHARS));
    }
}

void CommandRunner::echo_output(const ExecutionResult& result) const {
    if (!options_.echo) return;
    std::ostream& out = *options_.echo;

    if (!result.stdout_data.empty()) {
        out << "STDOUT:\n" << result.stdout_data << "\n";
    }
    if (!result.stderr_data.empty()) {
        out << "STDERR:\n" << result.stderr_data << "\n";
    }
    out.flush();
}
