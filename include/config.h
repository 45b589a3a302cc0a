#ifndef CONFIG_H
#define CONFIG_H

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Immutable per-run snapshot of the loop settings. Edits made to the store
// while a run is active only apply to the next run.
struct RunConfig {
  int sample_rate = 44100;
  double start_frequency = 1.0;
  double max_frequency = 150.0;
  double step = 0.25;
  double tone_duration = 1.0;
  double ir_delay = 10.0;
  double post_sleep = 5.0;
  int max_steps_per_run = 250;
  double fade_seconds = 0.05;
  float amplitude = 0.5f;
  std::string log_file = "stand.log";
  std::string actuation_command = "!r\n";
};

class ConfigStore {
public:
  static constexpr const char *DEFAULT_PATH = "stand.conf";

  explicit ConfigStore(std::string path = DEFAULT_PATH);

  // Reads the file, or creates and persists the defaults when it is missing.
  bool load();
  bool save() const;
  void loadDefaults();

  std::string getString(const std::string &section, const std::string &key,
                        const std::string &fallback = "") const;
  int getInt(const std::string &section, const std::string &key, int fallback) const;
  double getDouble(const std::string &section, const std::string &key,
                   double fallback) const;

  void set(const std::string &section, const std::string &key, const std::string &value);
  void setDouble(const std::string &section, const std::string &key, double value);

  bool hasSection(const std::string &section) const;
  bool hasOption(const std::string &section, const std::string &key) const;
  std::vector<std::string> sections() const;
  std::vector<std::pair<std::string, std::string>> items(const std::string &section) const;

  RunConfig snapshotRunConfig() const;
  std::string serialPort() const;
  int baudrate() const;
  std::string actuationCommand() const;
  bool verboseLogging() const;

  const std::string &path() const { return m_path; }
  bool isLoaded() const;

  static std::string formatNumber(double value);
  static std::string unescape(const std::string &raw);

private:
  bool parseFile(std::istream &in);
  std::string rawValue(const std::string &section, const std::string &key, bool &found) const;

  std::string m_path;
  mutable std::mutex m_mutex;
  std::map<std::string, std::map<std::string, std::string>> m_sections;
  bool m_loaded;
};

#endif
