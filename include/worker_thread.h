#ifndef WORKER_THREAD_H
#define WORKER_THREAD_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// std::thread with a bounded join. The body signals completion through a
// flag so the owner can give up waiting without detaching.
class WorkerThread {
public:
  WorkerThread();
  ~WorkerThread();

  WorkerThread(const WorkerThread &) = delete;
  WorkerThread &operator=(const WorkerThread &) = delete;

  // Returns false if a previous thread has not been joined yet.
  bool launch(std::function<void()> body);

  // Joins if the body finished within the timeout. A thread that is still
  // running stays joinable and can be retried later.
  bool joinFor(std::chrono::milliseconds timeout);
  void join();

  bool isRunning() const;
  bool joinable() const { return m_thread.joinable(); }

private:
  std::thread m_thread;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_finished;
};

#endif
