#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <chrono>

using Clock = std::chrono::steady_clock;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: every prompt gets the password
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        logging::debug(fmt::format("Keyboard-interactive prompt {}: {}", data->prompt_round + 1, prompt_text));

        if (data->callback) data->callback("Sending password...");
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// Errors that mean the socket or the SSH transport is gone, not just one channel
static bool is_transport_error(int rc) {
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_BAD_SOCKET:
    case LIBSSH2_ERROR_TIMEOUT:
        return true;
    default:
        return false;
    }
}

static bool expired(Clock::time_point deadline) {
    return Clock::now() >= deadline;
}

SessionManager::SessionManager(const ConnectionParameters& params)
    : params_(params), session_(nullptr), sock_(SSHBATCH_INVALID_SOCKET),
      libssh2_initialized_(false), active_(false) {
}

SessionManager::~SessionManager() {
    close();
}

ConnectResult SessionManager::establish(StatusCallback callback) {
    if (libssh2_init(0) != 0) {
        return ConnectResult::Err(ConnectFailure::NETWORK, "Failed to initialize libssh2");
    }
    libssh2_initialized_ = true;

    auto result = open_socket(callback);
    if (!result.is_ok()) {
        close();
        return result;
    }

    result = handshake(callback);
    if (!result.is_ok()) {
        close();
        return result;
    }

    result = ssh_userauth(callback);
    if (!result.is_ok()) {
        close();
        return result;
    }

    active_ = true;
    target_str_ = params_.target();

    if (callback) {
        callback("Connected to " + target_str_);
    }

    return ConnectResult::Ok(nullptr);
}

ConnectResult SessionManager::open_socket(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", params_.host, params_.port));
    }

    auto tcp = platform::connect_tcp(params_.host, params_.port, CONNECT_TIMEOUT_SECS * 1000);
    if (!tcp.ok()) {
        return ConnectResult::Err(tcp.timed_out ? ConnectFailure::TIMEOUT : ConnectFailure::NETWORK,
                                  tcp.error);
    }

    sock_ = tcp.sock;
    return ConnectResult::Ok(nullptr);
}

ConnectResult SessionManager::handshake(StatusCallback callback) {
    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init();
    if (!session_) {
        return ConnectResult::Err(ConnectFailure::NETWORK, "Failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    auto deadline = Clock::now() + std::chrono::seconds(CONNECT_TIMEOUT_SECS);
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (expired(deadline)) {
            return ConnectResult::Err(ConnectFailure::TIMEOUT, "SSH handshake timed out");
        }
        wait_socket();
    }

    if (rc != 0) {
        return ConnectResult::Err(ConnectFailure::NETWORK, "SSH handshake failed: " + last_error_message());
    }

    // Unknown host keys are accepted; the fingerprint is logged for reference.
    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1);
    if (hash) {
        std::string fingerprint;
        for (int i = 0; i < 20; i++) {
            if (i > 0) fingerprint += ':';
            fingerprint += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
        }
        logging::debug(fmt::format("Host key SHA1 fingerprint for {}: {}", params_.host, fingerprint));
    }

    if (callback) callback("SSH handshake complete, authenticating...");
    return ConnectResult::Ok(nullptr);
}

ConnectResult SessionManager::ssh_userauth(StatusCallback callback) {
    const std::string& user = params_.username;
    auto deadline = Clock::now() + std::chrono::seconds(CONNECT_TIMEOUT_SECS);
    int ret;

    if (params_.auth == AuthMethod::PUBLIC_KEY) {
        if (callback) callback("Using public key auth (" + params_.key_path + ")...");

        while ((ret = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                        params_.key_path.c_str(), "")) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                return ConnectResult::Err(ConnectFailure::TIMEOUT, "Authentication timed out");
            }
            wait_socket();
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return ConnectResult::Ok(nullptr);
        }
        return ConnectResult::Err(ConnectFailure::AUTH,
                                  "Public key authentication failed: " + last_error_message());
    }

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        if (expired(deadline)) {
            return ConnectResult::Err(ConnectFailure::TIMEOUT, "Authentication timed out");
        }
        wait_socket();
    }

    // Server accepted "none" auth
    if (!auth_list && libssh2_userauth_authenticated(session_)) {
        return ConnectResult::Ok(nullptr);
    }

    std::string methods = auth_list ? auth_list : "";
    if (!methods.empty()) {
        logging::debug("Auth methods: " + methods);
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        // Set up callback data via session abstract pointer
        KbdAuthData kbd_data;
        kbd_data.password = params_.password;
        kbd_data.prompt_round = 0;
        kbd_data.callback = callback;

        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return ConnectResult::Err(ConnectFailure::TIMEOUT, "Authentication timed out");
            }
            wait_socket();
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return ConnectResult::Ok(nullptr);
        }

        // keyboard-interactive failed, try password fallback
        logging::debug("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                user.c_str(), params_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (expired(deadline)) {
                return ConnectResult::Err(ConnectFailure::TIMEOUT, "Authentication timed out");
            }
            wait_socket();
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return ConnectResult::Ok(nullptr);
        }
    }

    return ConnectResult::Err(ConnectFailure::AUTH, "Authentication failed (check username/password)");
}

LIBSSH2_CHANNEL* SessionManager::open_exec_channel(const std::string& command, int& rc) {
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        rc = libssh2_session_last_errno(session_);
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            return nullptr;
        }
        wait_socket();
    }

    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket();
    }
    if (rc != 0) {
        libssh2_channel_free(channel);
        return nullptr;
    }

    return channel;
}

CommandOutcome SessionManager::run(const std::string& command) {
    if (!active_ || !session_) {
        return CommandOutcome::connection_lost("SSH session is not connected");
    }

    int rc = 0;
    LIBSSH2_CHANNEL* channel = open_exec_channel(command, rc);
    if (!channel) {
        return fault_from(rc, "Failed to start command");
    }

    // Drain stdout and stderr until the remote side sends EOF
    std::string output;
    std::string errors;
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        bool progressed = false;

        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            libssh2_channel_free(channel);
            return fault_from(static_cast<int>(n), "Failed reading command output");
        }

        n = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (n > 0) {
            errors.append(buf, static_cast<size_t>(n));
            progressed = true;
        } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            libssh2_channel_free(channel);
            return fault_from(static_cast<int>(n), "Failed reading command errors");
        }

        if (progressed) continue;
        if (libssh2_channel_eof(channel)) break;
        wait_socket();
    }

    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        wait_socket();
    }
    if (rc == 0) {
        while ((rc = libssh2_channel_wait_closed(channel)) == LIBSSH2_ERROR_EAGAIN) {
            wait_socket();
        }
    }

    int exit_status = FAILED_COMMAND_EXIT_STATUS;
    if (rc == 0) {
        exit_status = libssh2_channel_get_exit_status(channel);

        // A signal-killed command reports exit status 0; surface the signal instead
        char* exit_signal = nullptr;
        size_t signal_len = 0;
        libssh2_channel_get_exit_signal(channel, &exit_signal, &signal_len,
                                        nullptr, nullptr, nullptr, nullptr);
        if (exit_signal) {
            errors += fmt::format("Command terminated by signal SIG{}\n", std::string(exit_signal, signal_len));
            exit_status = FAILED_COMMAND_EXIT_STATUS;
            libssh2_free(session_, exit_signal);
        }
    }

    libssh2_channel_free(channel);

    if (rc != 0) {
        return fault_from(rc, "Failed to close command channel");
    }

    return CommandOutcome::completed(SSHResult{exit_status, output, errors});
}

CommandOutcome SessionManager::fault_from(int rc, const std::string& what) {
    std::string msg = fmt::format("{}: {} (libssh2 error {})", what, last_error_message(), rc);
    if (is_transport_error(rc)) {
        active_ = false;
        return CommandOutcome::connection_lost(msg);
    }
    return CommandOutcome::channel_fault(msg);
}

std::string SessionManager::last_error_message() {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, static_cast<size_t>(len));
}

// Block until the socket is ready in whichever direction libssh2 is waiting on
void SessionManager::wait_socket() {
    short events = 0;
    int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;

    if (events == 0 || sock_ == SSHBATCH_INVALID_SOCKET) {
        platform::sleep_ms(EAGAIN_POLL_MS);
        return;
    }
    platform::poll_socket(sock_, events, HANDSHAKE_POLL_MS);
}

void SessionManager::close() {
    active_ = false;

    if (session_) {
        // Blocking mode so the disconnect message is actually flushed
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != SSHBATCH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SSHBATCH_INVALID_SOCKET;
    }

    if (libssh2_initialized_) {
        libssh2_exit();
        libssh2_initialized_ = false;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
