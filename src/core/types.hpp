#pragma once

#include <string>
#include <vector>
#include <functional>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
};

// Ordered, comment-free list of commands, in execution order
using CommandList = std::vector<std::string>;

// Which credential a connection authenticates with
enum class AuthMethod {
    PASSWORD,
    PUBLIC_KEY,
};

struct ConnectionParameters {
    std::string host;
    int port = 22;
    std::string username;
    AuthMethod auth = AuthMethod::PASSWORD;
    std::string password;                        // used when auth == PASSWORD
    std::string key_path;                        // used when auth == PUBLIC_KEY

    std::string target() const {
        return username + "@" + host + ":" + std::to_string(port);
    }
};

// One executed command. Built once by the runner, never modified afterwards.
struct ExecutionResult {
    std::string command;
    int exit_status;
    std::string stdout_data;
    std::string stderr_data;

    bool succeeded() const { return exit_status == 0; }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
