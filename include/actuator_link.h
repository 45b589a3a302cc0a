#ifndef ACTUATOR_LINK_H
#define ACTUATOR_LINK_H

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include <termios.h>

// Serial link to the IR trigger microcontroller. All I/O is serialized
// under one lock; the IR worker uses the link but does not own it.
class ActuatorLink {
public:
  static constexpr int DEFAULT_BAUDRATE = 115200;
  static constexpr int WRITE_TIMEOUT_MS = 1000;

  ActuatorLink();
  virtual ~ActuatorLink();

  ActuatorLink(const ActuatorLink &) = delete;
  ActuatorLink &operator=(const ActuatorLink &) = delete;

  virtual bool connect(const std::string &port, int baudrate);
  virtual void disconnect();
  virtual bool isConnected() const;

  // Writes the bytes verbatim; no framing is added.
  virtual bool write(const std::string &bytes);
  // Returns the next '\n'-terminated line without its terminator, or
  // nullopt on timeout, disconnect or error.
  virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);
  virtual void resetInputBuffer();

  std::string portName() const;

  static bool baudConstant(int baudrate, speed_t &out);

private:
  void closeLocked();

  mutable std::mutex m_mutex;
  int m_fd;
  std::string m_port;
  std::string m_rxBuffer;
};

#endif
