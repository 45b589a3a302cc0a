#include "actuator_link.h"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

ActuatorLink::ActuatorLink()
    : m_fd(-1) {
}

ActuatorLink::~ActuatorLink() {
    std::lock_guard<std::mutex> lock(m_mutex);
    closeLocked();
}

bool ActuatorLink::baudConstant(int baudrate, speed_t& out) {
    switch (baudrate) {
        case 9600:
            out = B9600;
            return true;
        case 19200:
            out = B19200;
            return true;
        case 38400:
            out = B38400;
            return true;
        case 57600:
            out = B57600;
            return true;
        case 115200:
            out = B115200;
            return true;
        case 230400:
            out = B230400;
            return true;
        default:
            return false;
    }
}

bool ActuatorLink::connect(const std::string& port, int baudrate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fd >= 0) {
        closeLocked();
    }

    speed_t speed = B115200;
    if (!baudConstant(baudrate, speed)) {
        std::cerr << "[Serial] unsupported baudrate " << baudrate << "\n";
        return false;
    }

    std::cout << "[Serial] opening " << port << " at " << baudrate << " baud\n";
    const int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) {
        std::cerr << "[Serial] could not open " << port << ": " << std::strerror(errno) << "\n";
        return false;
    }

    struct termios tty;
    if (tcgetattr(fd, &tty) != 0) {
        std::cerr << "[Serial] tcgetattr failed on " << port << ": " << std::strerror(errno) << "\n";
        ::close(fd);
        return false;
    }

    cfmakeraw(&tty);
    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    if (tcsetattr(fd, TCSANOW, &tty) != 0) {
        std::cerr << "[Serial] tcsetattr failed on " << port << ": " << std::strerror(errno) << "\n";
        ::close(fd);
        return false;
    }

    m_fd = fd;
    m_port = port;
    m_rxBuffer.clear();
    std::cout << "[Serial] connected\n";
    return true;
}

void ActuatorLink::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fd < 0) {
        std::cout << "[Serial] not connected\n";
        return;
    }
    closeLocked();
    std::cout << "[Serial] disconnected from " << m_port << "\n";
}

bool ActuatorLink::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_fd >= 0;
}

bool ActuatorLink::write(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fd < 0) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(WRITE_TIMEOUT_MS);
    size_t total = 0;
    while (total < bytes.size()) {
        const ssize_t written = ::write(m_fd, bytes.data() + total, bytes.size() - total);
        if (written > 0) {
            total += static_cast<size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                std::cerr << "[Serial] write timed out on " << m_port << "\n";
                return false;
            }
            pollfd pfd{m_fd, POLLOUT, 0};
            ::poll(&pfd, 1, static_cast<int>(left.count()));
            continue;
        }
        const int err = errno;
        std::cerr << "[Serial] write failed on " << m_port << ": " << std::strerror(err) << "\n";
        if (err == EIO || err == ENXIO || err == EBADF) {
            closeLocked();
        }
        return false;
    }
    return true;
}

std::optional<std::string> ActuatorLink::readLine(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fd < 0) {
        return std::nullopt;
    }

    const auto takeLine = [this]() -> std::optional<std::string> {
        const size_t pos = m_rxBuffer.find('\n');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        std::string line = m_rxBuffer.substr(0, pos);
        m_rxBuffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    };

    if (auto line = takeLine()) {
        return line;
    }

    char temp[256];
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }

        pollfd pfd{m_fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[Serial] poll failed: " << std::strerror(errno) << "\n";
            return std::nullopt;
        }
        if (rc == 0) {
            break;
        }
        if ((pfd.revents & (POLLHUP | POLLERR)) != 0 && (pfd.revents & POLLIN) == 0) {
            std::cerr << "[Serial] device hung up: " << m_port << "\n";
            closeLocked();
            return std::nullopt;
        }

        const ssize_t n = ::read(m_fd, temp, sizeof(temp));
        if (n > 0) {
            m_rxBuffer.append(temp, static_cast<size_t>(n));
            if (auto line = takeLine()) {
                return line;
            }
        } else if (n == 0) {
            closeLocked();
            return std::nullopt;
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            std::cerr << "[Serial] read failed: " << std::strerror(errno) << "\n";
            return std::nullopt;
        }
    }
    return std::nullopt;
}

void ActuatorLink::resetInputBuffer() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rxBuffer.clear();
    if (m_fd >= 0) {
        tcflush(m_fd, TCIFLUSH);
    }
}

std::string ActuatorLink::portName() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
}

void ActuatorLink::closeLocked() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = -1;
    m_rxBuffer.clear();
}
