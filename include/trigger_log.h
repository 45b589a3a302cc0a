#ifndef TRIGGER_LOG_H
#define TRIGGER_LOG_H

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct LogEntry {
  std::string timestamp;
  double frequency = 0.0;
};

// Append-only record of successful actuations, one line per firing:
// "YYYY-MM-DD HH:MM:SS: <frequency with one decimal>".
class TriggerLog {
public:
  explicit TriggerLog(std::string path);

  bool append(double frequency);
  bool append(std::chrono::system_clock::time_point when, double frequency);

  const std::string &path() const { return m_path; }

  static std::string formatEntry(std::chrono::system_clock::time_point when, double frequency);
  static bool parseLine(const std::string &line, LogEntry &out);
  // Missing file yields an empty list; unparseable lines are skipped.
  static std::vector<LogEntry> readEntries(const std::string &path);

private:
  std::string m_path;
  std::mutex m_mutex;
};

#endif
