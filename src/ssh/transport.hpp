#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>

// How a single command attempt ended.
enum class OutcomeKind {
    COMPLETED,        // Remote command ran and reported an exit status
    CHANNEL_FAULT,    // This command's channel failed; the session is still usable
    CONNECTION_LOST,  // The transport itself is gone; no further commands can run
};

struct CommandOutcome {
    OutcomeKind kind;
    SSHResult result;     // exit status + captured streams when COMPLETED
    std::string fault;    // description when not COMPLETED

    static CommandOutcome completed(SSHResult r) {
        return {OutcomeKind::COMPLETED, std::move(r), ""};
    }

    static CommandOutcome channel_fault(const std::string& why) {
        return {OutcomeKind::CHANNEL_FAULT, SSHResult{-1, "", ""}, why};
    }

    static CommandOutcome connection_lost(const std::string& why) {
        return {OutcomeKind::CONNECTION_LOST, SSHResult{-1, "", ""}, why};
    }
};

// An authenticated connection to one host.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Run one command to completion. Never throws for remote failures;
    // they come back as CHANNEL_FAULT or CONNECTION_LOST.
    virtual CommandOutcome run(const std::string& command) = 0;

    // Release the connection. Safe to call more than once.
    virtual void close() = 0;

    virtual bool is_active() const = 0;
};

enum class ConnectFailure {
    NONE,
    AUTH,       // Server rejected the credentials
    NETWORK,    // Resolve / TCP / SSH handshake failure
    TIMEOUT,    // No answer within CONNECT_TIMEOUT_SECS
};

const char* connect_failure_name(ConnectFailure failure);

struct ConnectResult {
    ConnectFailure failure;
    std::string error;
    std::unique_ptr<RemoteSession> session;   // set iff failure == NONE

    bool is_ok() const { return failure == ConnectFailure::NONE; }

    static ConnectResult Ok(std::unique_ptr<RemoteSession> session) {
        return {ConnectFailure::NONE, "", std::move(session)};
    }

    static ConnectResult Err(ConnectFailure failure, const std::string& error) {
        return {failure, error, nullptr};
    }
};

// Opens sessions. The production implementation is ConnectionFactory (libssh2);
// tests substitute an in-memory one.
class Transport {
public:
    virtual ~Transport() = default;

    virtual ConnectResult connect(const ConnectionParameters& params,
                                  StatusCallback callback = nullptr) = 0;
};
