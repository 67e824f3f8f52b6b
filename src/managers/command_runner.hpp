#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>

struct RunnerOptions {
    int command_delay_ms = 0;         // pause between consecutive commands
    std::ostream* echo = nullptr;     // when set, command output is printed here
};

struct RunReport {
    std::vector<ExecutionResult> results;   // one per attempted command, in order
    size_t total_commands = 0;
    bool connected = false;
    bool aborted = false;                   // connection lost mid-run
    ConnectFailure connect_failure = ConnectFailure::NONE;
    std::string error;                      // connection or abort cause
    bool all_succeeded = false;

    size_t succeeded_count() const;

    // "Execution complete: X/Y commands successful"
    std::string summary() const;
};

// Owns a session for one scope and closes it exactly once, whichever way
// the scope is left.
class SessionGuard {
public:
    explicit SessionGuard(std::unique_ptr<RemoteSession> session);
    ~SessionGuard();

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

    RemoteSession* operator->() { return session_.get(); }

    // Close now instead of at scope exit.
    void close();

private:
    std::unique_ptr<RemoteSession> session_;
    bool closed_;
};

// Runs a command list against one host over a single session.
//
// Commands run strictly in order. A command that fails, or whose channel
// fails, is recorded and the next one runs. Losing the connection ends the
// run early; results then hold only the commands attempted so far. Nothing
// is ever retried.
class CommandRunner {
public:
    explicit CommandRunner(Transport& transport, RunnerOptions options = RunnerOptions());

    RunReport run(const ConnectionParameters& params, const CommandList& commands);

private:
    Transport& transport_;
    RunnerOptions options_;

    void log_result(size_t position, size_t total, const ExecutionResult& result,
                    const CommandOutcome& outcome) const;
    void echo_output(const ExecutionResult& result) const;
};
