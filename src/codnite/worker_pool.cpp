#include <codnite/worker_pool.h>

#include <sys/sysinfo.h>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <codnite/utils.h>
#include <codnite/submission.h>

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);

} // namespace

WorkerPool::Slot& WorkerPool::Slot::operator=(Slot&& x) noexcept {
  if (this != &x) {
    Release();
    pool_ = x.pool_;
    status_ = x.status_;
    x.pool_ = nullptr;
  }
  return *this;
}

void WorkerPool::Slot::Release() {
  if (!pool_) return;
  pool_->Release_();
  pool_ = nullptr;
}

WorkerPool::WorkerPool(int capacity, size_t max_queue, std::chrono::milliseconds max_wait) :
    capacity_(std::max(capacity, 1)), max_queue_(max_queue), max_wait_(max_wait),
    running_(0), next_ticket_(0) {}

WorkerPool::Slot WorkerPool::Acquire(const CancelToken* token) {
  std::unique_lock lck(mtx_);
  if (token && token->IsCancelled()) return Slot(nullptr, AcquireStatus::CANCELLED);
  if (waiting_.empty() && running_ < capacity_) {
    running_++;
    return Slot(this, AcquireStatus::ACQUIRED);
  }
  if (waiting_.size() >= max_queue_) {
    spdlog::info("Worker pool full: running={} queued={}", running_, waiting_.size());
    return Slot(nullptr, AcquireStatus::QUEUE_FULL);
  }
  const long ticket = next_ticket_++;
  waiting_.push_back(ticket);
  const auto deadline = std::chrono::steady_clock::now() + max_wait_;
  AcquireStatus status = AcquireStatus::ACQUIRED;
  while (true) {
    if (waiting_.front() == ticket && running_ < capacity_) break;
    if (token && token->IsCancelled()) {
      status = AcquireStatus::CANCELLED;
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      status = AcquireStatus::QUEUE_TIMEOUT;
      break;
    }
    // wake up periodically to observe cancellation
    cv_.wait_until(lck, std::min(deadline, now + kCancelPollInterval));
  }
  waiting_.erase(std::find(waiting_.begin(), waiting_.end(), ticket));
  if (status == AcquireStatus::ACQUIRED) {
    running_++;
  } else {
    spdlog::info("Worker pool wait aborted: ticket={} status={}", ticket, AcquireStatusName(status));
  }
  // the next waiter may be eligible now
  cv_.notify_all();
  return Slot(status == AcquireStatus::ACQUIRED ? this : nullptr, status);
}

void WorkerPool::Release_() {
  {
    std::lock_guard lck(mtx_);
    running_--;
  }
  cv_.notify_all();
}

WorkerPool::Stats WorkerPool::GetStats() const {
  std::lock_guard lck(mtx_);
  return {capacity_, running_, waiting_.size(), max_queue_};
}

int HostWorkerCapacity(long per_run_kb) {
  long cores = get_nprocs();
  struct sysinfo info = {};
  long by_memory = cores;
  if (sysinfo(&info) == 0 && per_run_kb > 0) {
    long total_kb = (long)((unsigned long long)info.totalram * info.mem_unit / 1024);
    by_memory = total_kb / per_run_kb;
  } else {
    spdlog::warn("Cannot determine host memory; worker capacity derived from cores only");
  }
  return (int)std::max(1L, std::min(cores, by_memory));
}
