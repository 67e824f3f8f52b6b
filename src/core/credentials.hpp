#pragma once

#include <functional>
#include <string>
#include "types.hpp"

// Asks the user for a password; returns "" if none was entered.
using PasswordPrompt = std::function<std::string(const std::string& prompt)>;

struct CredentialInput {
    std::string host;
    std::string username;
    int port;
    std::string password;
    std::string key_path;
};

// Decide how to authenticate:
//   - a non-empty password wins;
//   - otherwise an existing key file ("~" expanded) selects key auth;
//   - otherwise the prompt (if any) is asked for a password.
// Fails when none of these produces a credential.
Result<ConnectionParameters> resolve_credentials(const CredentialInput& input,
                                                 const PasswordPrompt& prompt = nullptr);
