#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace oxt {

// Bounded multi-producer/multi-consumer queue. push() blocks while full,
// pop() blocks while empty; after close() pop() drains what is left and
// then returns false.
template <typename T>
class WorkQueue {
public:
  explicit WorkQueue(std::size_t cap) : cap_(cap > 0 ? cap : 1) {}

  void push(T&& v) {
    std::unique_lock<std::mutex> lk(m_);
    cv_push_.wait(lk, [&] { return q_.size() < cap_ || closed_; });
    if (closed_) return;
    q_.emplace_back(std::move(v));
    cv_pop_.notify_one();
  }

  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(m_);
    cv_pop_.wait(lk, [&] { return !q_.empty() || closed_; });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    cv_push_.notify_one();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lk(m_);
    closed_ = true;
    cv_pop_.notify_all();
    cv_push_.notify_all();
  }

private:
  std::mutex m_;
  std::condition_variable cv_push_;
  std::condition_variable cv_pop_;
  std::deque<T> q_;
  std::size_t cap_;
  bool closed_ = false;
};

// Worker count for a parallel stage: `requested` if non-zero, else $OXT_THREADS,
// else hardware concurrency (4 when unknown). Capped at 64.
unsigned resolve_threads(unsigned requested);

}
