#include "worker_thread.h"

#include <exception>
#include <iostream>

WorkerThread::WorkerThread()
    : m_finished(true) {
}

WorkerThread::~WorkerThread() {
    join();
}

bool WorkerThread::launch(std::function<void()> body) {
    if (m_thread.joinable()) {
        if (!joinFor(std::chrono::milliseconds(0))) {
            return false;
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = false;
    }
    m_thread = std::thread([this, body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            std::cerr << "[Workers] thread terminated by exception: " << e.what() << "\n";
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished = true;
        m_cv.notify_all();
    });
    return true;
}

bool WorkerThread::joinFor(std::chrono::milliseconds timeout) {
    if (!m_thread.joinable()) {
        return true;
    }
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, timeout, [this]() { return m_finished; })) {
            return false;
        }
    }
    m_thread.join();
    return true;
}

void WorkerThread::join() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool WorkerThread::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_finished;
}
