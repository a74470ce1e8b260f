/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace LatticeMint {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Debug builds print every level to stdout
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("LatticeMint - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define LATTICE_CRITICAL(system, msg)                                          \
  LatticeMint::Logger::Log(LatticeMint::LogLevel::CRITICAL, system, msg)
#define LATTICE_ERROR(system, msg)                                             \
  LatticeMint::Logger::Log(LatticeMint::LogLevel::ERROR_LEVEL, system, msg)
#define LATTICE_WARN(system, msg)                                              \
  LatticeMint::Logger::Log(LatticeMint::LogLevel::WARNING, system, msg)
#define LATTICE_INFO(system, msg)                                              \
  LatticeMint::Logger::Log(LatticeMint::LogLevel::INFO, system, msg)
#define LATTICE_DEBUG(system, msg)                                             \
  LatticeMint::Logger::Log(LatticeMint::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds keep CRITICAL and ERROR only, written to a log file
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Guards the log file

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Appends to logs/latticemint_<start time>.log, opened on first use
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define LATTICE_CRITICAL(system, msg)                                          \
  LatticeMint::Logger::Log("CRITICAL", system, msg)

#define LATTICE_ERROR(system, msg)                                             \
  LatticeMint::Logger::Log("ERROR", system, msg)

#define LATTICE_WARN(system, msg) ((void)0)  // Zero overhead
#define LATTICE_INFO(system, msg) ((void)0)  // Zero overhead
#define LATTICE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Service facade
#define LEDGER_CRITICAL(msg) LATTICE_CRITICAL("LatticeLedger", msg)
#define LEDGER_ERROR(msg) LATTICE_ERROR("LatticeLedger", msg)
#define LEDGER_WARN(msg) LATTICE_WARN("LatticeLedger", msg)
#define LEDGER_INFO(msg) LATTICE_INFO("LatticeLedger", msg)
#define LEDGER_DEBUG(msg) LATTICE_DEBUG("LatticeLedger", msg)

// Ledger components
#define COLLECTION_CRITICAL(msg) LATTICE_CRITICAL("CollectionRegistry", msg)
#define COLLECTION_ERROR(msg) LATTICE_ERROR("CollectionRegistry", msg)
#define COLLECTION_WARN(msg) LATTICE_WARN("CollectionRegistry", msg)
#define COLLECTION_INFO(msg) LATTICE_INFO("CollectionRegistry", msg)
#define COLLECTION_DEBUG(msg) LATTICE_DEBUG("CollectionRegistry", msg)

#define PARAMS_CRITICAL(msg) LATTICE_CRITICAL("LatticeParameterStore", msg)
#define PARAMS_ERROR(msg) LATTICE_ERROR("LatticeParameterStore", msg)
#define PARAMS_WARN(msg) LATTICE_WARN("LatticeParameterStore", msg)
#define PARAMS_INFO(msg) LATTICE_INFO("LatticeParameterStore", msg)
#define PARAMS_DEBUG(msg) LATTICE_DEBUG("LatticeParameterStore", msg)

#define TOKEN_CRITICAL(msg) LATTICE_CRITICAL("TokenRegistry", msg)
#define TOKEN_ERROR(msg) LATTICE_ERROR("TokenRegistry", msg)
#define TOKEN_WARN(msg) LATTICE_WARN("TokenRegistry", msg)
#define TOKEN_INFO(msg) LATTICE_INFO("TokenRegistry", msg)
#define TOKEN_DEBUG(msg) LATTICE_DEBUG("TokenRegistry", msg)

#define OWNERSHIP_CRITICAL(msg) LATTICE_CRITICAL("OwnershipIndex", msg)
#define OWNERSHIP_ERROR(msg) LATTICE_ERROR("OwnershipIndex", msg)
#define OWNERSHIP_WARN(msg) LATTICE_WARN("OwnershipIndex", msg)
#define OWNERSHIP_INFO(msg) LATTICE_INFO("OwnershipIndex", msg)
#define OWNERSHIP_DEBUG(msg) LATTICE_DEBUG("OwnershipIndex", msg)

#define MARKET_CRITICAL(msg) LATTICE_CRITICAL("MarketplaceLedger", msg)
#define MARKET_ERROR(msg) LATTICE_ERROR("MarketplaceLedger", msg)
#define MARKET_WARN(msg) LATTICE_WARN("MarketplaceLedger", msg)
#define MARKET_INFO(msg) LATTICE_INFO("MarketplaceLedger", msg)
#define MARKET_DEBUG(msg) LATTICE_DEBUG("MarketplaceLedger", msg)

#define FEE_CRITICAL(msg) LATTICE_CRITICAL("FeeEngine", msg)
#define FEE_ERROR(msg) LATTICE_ERROR("FeeEngine", msg)
#define FEE_WARN(msg) LATTICE_WARN("FeeEngine", msg)
#define FEE_INFO(msg) LATTICE_INFO("FeeEngine", msg)
#define FEE_DEBUG(msg) LATTICE_DEBUG("FeeEngine", msg)

// Collaborators and support code
#define BALANCE_CRITICAL(msg) LATTICE_CRITICAL("BalanceLedger", msg)
#define BALANCE_ERROR(msg) LATTICE_ERROR("BalanceLedger", msg)
#define BALANCE_WARN(msg) LATTICE_WARN("BalanceLedger", msg)
#define BALANCE_INFO(msg) LATTICE_INFO("BalanceLedger", msg)
#define BALANCE_DEBUG(msg) LATTICE_DEBUG("BalanceLedger", msg)

#define CONFIG_CRITICAL(msg) LATTICE_CRITICAL("LedgerConfig", msg)
#define CONFIG_ERROR(msg) LATTICE_ERROR("LedgerConfig", msg)
#define CONFIG_WARN(msg) LATTICE_WARN("LedgerConfig", msg)
#define CONFIG_INFO(msg) LATTICE_INFO("LedgerConfig", msg)
#define CONFIG_DEBUG(msg) LATTICE_DEBUG("LedgerConfig", msg)

#define SNAPSHOT_CRITICAL(msg) LATTICE_CRITICAL("LedgerSnapshot", msg)
#define SNAPSHOT_ERROR(msg) LATTICE_ERROR("LedgerSnapshot", msg)
#define SNAPSHOT_WARN(msg) LATTICE_WARN("LedgerSnapshot", msg)
#define SNAPSHOT_INFO(msg) LATTICE_INFO("LedgerSnapshot", msg)
#define SNAPSHOT_DEBUG(msg) LATTICE_DEBUG("LedgerSnapshot", msg)

// Benchmark mode convenience macros
#define LATTICE_ENABLE_BENCHMARK_MODE()                                        \
  LatticeMint::Logger::SetBenchmarkMode(true)
#define LATTICE_DISABLE_BENCHMARK_MODE()                                       \
  LatticeMint::Logger::SetBenchmarkMode(false)

} // namespace LatticeMint

#endif // LOGGER_HPP
