#ifndef FAKE_ACTUATOR_LINK_H
#define FAKE_ACTUATOR_LINK_H

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "actuator_link.h"

class FakeActuatorLink : public ActuatorLink {
public:
  explicit FakeActuatorLink(bool connected = true, bool writesSucceed = true)
      : m_connected(connected), m_writesSucceed(writesSucceed) {}

  bool connect(const std::string &port, int baudrate) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_port = port;
    m_baudrate = baudrate;
    m_connected = m_connectSucceeds;
    return m_connected;
  }

  void disconnect() override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connected = false;
  }

  bool isConnected() const override {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_connected;
  }

  bool write(const std::string &bytes) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_attempts++;
    if (!m_connected || !m_writesSucceed) {
      return false;
    }
    m_writes.push_back(bytes);
    return true;
  }

  std::optional<std::string> readLine(std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_replies.empty()) {
      return std::nullopt;
    }
    std::string line = m_replies.front();
    m_replies.pop_front();
    return line;
  }

  void resetInputBuffer() override {}

  void setConnectSucceeds(bool succeeds) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_connectSucceeds = succeeds;
  }
  void setWritesSucceed(bool succeed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_writesSucceed = succeed;
  }
  void queueReply(const std::string &line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_replies.push_back(line);
  }

  std::vector<std::string> writes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
  }
  int attempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_attempts;
  }
  std::string lastPort() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
  }
  int lastBaudrate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_baudrate;
  }

private:
  mutable std::mutex m_mutex;
  bool m_connected;
  bool m_writesSucceed;
  bool m_connectSucceeds = true;
  int m_attempts = 0;
  int m_baudrate = 0;
  std::string m_port;
  std::vector<std::string> m_writes;
  std::deque<std::string> m_replies;
};

#endif
