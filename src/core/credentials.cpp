#include "credentials.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <filesystem>

Result<ConnectionParameters> resolve_credentials(const CredentialInput& input,
                                                 const PasswordPrompt& prompt) {
    ConnectionParameters params;
    params.host = input.host;
    params.username = input.username;
    params.port = input.port;

    if (!input.password.empty()) {
        params.auth = AuthMethod::PASSWORD;
        params.password = input.password;
        return Result<ConnectionParameters>::Ok(params);
    }

    if (!input.key_path.empty()) {
        std::string key_path = platform::expand_user(input.key_path);
        std::error_code ec;
        if (std::filesystem::is_regular_file(key_path, ec)) {
            params.auth = AuthMethod::PUBLIC_KEY;
            params.key_path = key_path;
            return Result<ConnectionParameters>::Ok(params);
        }
        logging::warning("Key file not found: " + key_path);
    }

    if (prompt) {
        std::string password = prompt("Password for " + input.username + "@" + input.host + ": ");
        if (!password.empty()) {
            params.auth = AuthMethod::PASSWORD;
            params.password = password;
            return Result<ConnectionParameters>::Ok(params);
        }
    }

    return Result<ConnectionParameters>::Err("No authentication method provided (password or key)");
}
