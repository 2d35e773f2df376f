#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

// Process-wide sink setup. Call once in main() before any component is built.
void init_logging(const std::string &level = "info");

// Named logger on the shared console sink, e.g. "conn.coinbase", "gateway".
std::shared_ptr<spdlog::logger> make_logger(const std::string &name);

// Logger that discards everything; tests inject this.
std::shared_ptr<spdlog::logger> make_silent_logger(const std::string &name = "silent");

// Flush all registered loggers and release sinks.
void shutdown_logging();
