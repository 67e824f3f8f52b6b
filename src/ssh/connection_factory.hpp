#pragma once

#include <core/types.hpp>
#include "transport.hpp"

// ConnectionFactory: opens libssh2-backed sessions.
//
// Each connect() call performs a full TCP connect, SSH handshake and user
// authentication and hands the caller sole ownership of the session.
class ConnectionFactory : public Transport {
public:
    ConnectResult connect(const ConnectionParameters& params,
                          StatusCallback callback = nullptr) override;
};
