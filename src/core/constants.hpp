#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* SSHBATCH_VERSION = "0.2.0";

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + handshake + auth deadline
constexpr int EAGAIN_POLL_MS             = 10;    // Sleep between libssh2 EAGAIN retries
constexpr int HANDSHAKE_POLL_MS          = 100;

// ── Command execution ───────────────────────────────────────
constexpr int FAILED_COMMAND_EXIT_STATUS = -1;    // Sentinel for commands that never produced a status
constexpr int DEFAULT_COMMAND_DELAY_MS   = 500;   // Pause between consecutive commands

// ── Prompts ─────────────────────────────────────────────────
constexpr int PASSWORD_PROMPT_TIMEOUT_MS = 60000;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_PREVIEW_CHARS   = 500;

// ── File defaults ───────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE   = "config.json";
constexpr const char* DEFAULT_COMMANDS_FILE = "commands.txt";
constexpr const char* DEFAULT_EXAMPLE_FILE  = "test_commands.txt";
