/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only, the debug logger is header-only
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace LatticeMint {
namespace {

namespace fs = std::filesystem;

constexpr const char *LOG_DIRECTORY = "logs";
constexpr const char *LOG_PREFIX = "latticemint_";
constexpr size_t LOG_FILES_KEPT = 5;

std::tm localNow(std::chrono::system_clock::time_point now) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm local{};
  localtime_r(&seconds, &local);
  return local;
}

// Removes the oldest ledger logs so that at most keep - 1 remain before a new
// one is opened
void pruneLogs(const fs::path &directory, size_t keep) {
  std::error_code ec;
  std::vector<fs::path> logs;
  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(ec) && name.starts_with(LOG_PREFIX) &&
        entry.path().extension() == ".log") {
      logs.push_back(entry.path());
    }
  }
  if (logs.size() < keep) {
    return;
  }

  // Names embed the start time, so lexical order is chronological
  std::sort(logs.begin(), logs.end());
  const size_t excess = logs.size() - keep + 1;
  for (size_t i = 0; i < excess; ++i) {
    fs::remove(logs[i], ec);
  }
}

class LedgerLogFile {
public:
  void append(const char *level, const char *system, const char *message) {
    std::call_once(m_openFlag, [this] { open(); });

    std::lock_guard<std::mutex> lock(Logger::s_logMutex);
    if (!m_stream) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::tm local = localNow(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
                        1000;

    m_stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setw(3) << std::setfill('0') << millis << ' ' << level
             << " [" << system << "] " << message << std::endl;
  }

private:
  void open() {
    const fs::path directory(LOG_DIRECTORY);
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
      return;
    }
    pruneLogs(directory, LOG_FILES_KEPT);

    const std::tm local = localNow(std::chrono::system_clock::now());
    std::ostringstream name;
    name << LOG_PREFIX << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";

    m_stream.open(directory / name.str(), std::ios::out | std::ios::app);
    if (m_stream) {
      m_stream << "# " << LATTICEMINT_APP_NAME << " ledger log opened "
               << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << std::endl;
    }
  }

  std::once_flag m_openFlag;
  std::ofstream m_stream;
};

LedgerLogFile &ledgerLogFile() {
  static LedgerLogFile file;
  return file;
}

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  ledgerLogFile().append(level, system, message);
}

} // namespace LatticeMint

#endif // DEBUG
