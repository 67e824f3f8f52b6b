#pragma once

#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One libssh2 session: TCP socket, handshake, user auth. Each command gets
// its own exec channel so stdout, stderr and the exit status stay separate.
class SessionManager : public RemoteSession {
public:
    explicit SessionManager(const ConnectionParameters& params);
    ~SessionManager() override;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // On failure everything acquired so far is released again.
    ConnectResult establish(StatusCallback callback = nullptr);

    CommandOutcome run(const std::string& command) override;
    void close() override;
    bool is_active() const override;

private:
    ConnectionParameters params_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool libssh2_initialized_;
    bool active_;
    std::string target_str_;

    ConnectResult open_socket(StatusCallback callback);
    ConnectResult handshake(StatusCallback callback);
    ConnectResult ssh_userauth(StatusCallback callback);

    LIBSSH2_CHANNEL* open_exec_channel(const std::string& command, int& rc);
    CommandOutcome fault_from(int rc, const std::string& what);
    std::string last_error_message();
    void wait_socket();
};
