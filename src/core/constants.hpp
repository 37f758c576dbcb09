#pragma once

#include <cstddef>

// ── Identity ────────────────────────────────────────────────
constexpr const char* SFTPFETCH_NAME    = "sftpfetch";
constexpr const char* SFTPFETCH_VERSION = "0.3.0";

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SFTP_PORT          = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT    = 30;    // seconds, TCP connect only
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t SFTP_TRANSFER_BUF_SIZE  = 32768; // per read during get()
constexpr size_t HASH_BLOCK_SIZE         = 65536; // per read while hashing
constexpr size_t SFTP_NAME_BUF_SIZE      = 1024;

// ── Ledger ──────────────────────────────────────────────────
constexpr int LEDGER_JSON_INDENT         = 2;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_RUN_FAILED            = 1;
constexpr int EXIT_USAGE                 = 2;
