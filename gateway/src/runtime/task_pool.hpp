#pragma once
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace tutorgate {
namespace gateway {

// Fixed-size worker pool. Tasks run in submission order on the first free thread.
class TaskPool {
 public:
  using Task = std::function<void()>;
  using ErrorHandler = std::function<void(const std::string&)>;

  explicit TaskPool(int concurrency, ErrorHandler on_error = nullptr)
      : concurrency_(concurrency > 0 ? concurrency : 1), on_error_(std::move(on_error)), stop_(false) {
    for (int i = 0; i < concurrency_; ++i) {
      threads_.emplace_back([this]() { this->run(); });
    }
  }
  ~TaskPool() { shutdown(); }

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  // Returns false once the pool is shutting down.
  bool submit(Task t) {
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (stop_) return false;
      q_.push(std::move(t));
    }
    cv_.notify_one();
    return true;
  }

  // Runs every queued task, then joins the workers. Idempotent.
  void shutdown() {
    {
      std::unique_lock<std::mutex> lk(mu_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto &t : threads_) {
      if (t.joinable()) t.join();
    }
  }

  size_t queue_depth() const {
    std::unique_lock<std::mutex> lk(mu_);
    return q_.size();
  }

  int concurrency() const { return concurrency_; }

 private:
  void run() {
    while (true) {
      Task task;
      {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this]{ return stop_ || !q_.empty(); });
        if (stop_ && q_.empty()) return;
        task = std::move(q_.front());
        q_.pop();
      }
      try {
        task();
      } catch (const std::exception& e) {
        if (on_error_) on_error_(e.what());
      }
    }
  }

  int concurrency_;
  ErrorHandler on_error_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::queue<Task> q_;
  bool stop_;
  std::vector<std::thread> threads_;
};

} // namespace gateway
} // namespace tutorgate
