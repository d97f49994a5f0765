#ifndef INCLUDE_CODNITE_WORKER_POOL_H_
#define INCLUDE_CODNITE_WORKER_POOL_H_

#include <mutex>
#include <deque>
#include <chrono>
#include <condition_variable>

#define ENUM_ACQUIRE_STATUS_ \
  X(ACQUIRED) \
  X(QUEUE_FULL) \
  X(QUEUE_TIMEOUT) \
  X(CANCELLED)
enum class AcquireStatus {
#define X(name) name,
  ENUM_ACQUIRE_STATUS_
#undef X
};

class CancelToken;

// Bounds the number of submissions executing at once.
// Requests beyond capacity wait in arrival order; at most max_queue of them may wait,
//   and none longer than max_wait. Everything else is rejected immediately.
class WorkerPool {
 public:
  class Slot {
    WorkerPool* pool_;
    AcquireStatus status_;
    Slot(WorkerPool* pool, AcquireStatus status) : pool_(pool), status_(status) {}
    friend class WorkerPool;
   public:
    Slot(Slot&& x) noexcept : pool_(x.pool_), status_(x.status_) { x.pool_ = nullptr; }
    Slot& operator=(Slot&& x) noexcept;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot() { Release(); }

    AcquireStatus Status() const { return status_; }
    explicit operator bool() const { return pool_ != nullptr; }
    // no-op if already released or not acquired
    void Release();
  };

  struct Stats {
    int capacity;
    int running;
    size_t queued;
    size_t max_queue;
  };

  WorkerPool(int capacity, size_t max_queue, std::chrono::milliseconds max_wait);
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Block until a slot is free; the token is checked while waiting
  Slot Acquire(const CancelToken* token = nullptr);
  Stats GetStats() const;

 private:
  void Release_();

  const int capacity_;
  const size_t max_queue_;
  const std::chrono::milliseconds max_wait_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  int running_;
  long next_ticket_;
  std::deque<long> waiting_; // tickets in arrival order
};

// min(cpu cores, total memory / per_run_kb), at least 1
int HostWorkerCapacity(long per_run_kb);

#endif  // INCLUDE_CODNITE_WORKER_POOL_H_
