#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging used by ALL engine modules.
  - Centralizes stdout/stderr policy for the engine and mcda_cli.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation). Analyses may run on
    many threads at once; their log lines must not interleave.
  - Caller controls severity; implementation routes WARN/ERROR to stderr.
===========================================================
*/

#include <string>

namespace mcda {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Route every level to stderr (for tools whose stdout carries data).
void set_log_stderr_only(bool on) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parse "debug" / "info" / "warn" / "error" (case-sensitive). Returns false
// and leaves `out` untouched on anything else.
bool parse_log_level(const std::string& s, LogLevel& out) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace mcda
