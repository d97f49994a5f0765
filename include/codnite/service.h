#ifndef INCLUDE_CODNITE_SERVICE_H_
#define INCLUDE_CODNITE_SERVICE_H_

#include <mutex>
#include <memory>
#include <string>
#include <unordered_map>

#include "verdict.h"
#include "submission.h"
#include "worker_pool.h"

struct JudgeResponse {
  JudgeStatus status;
  std::string details; // validation reason; empty otherwise
  SubmissionResult result; // meaningful only if status == OK
};

// Entry point of the judging engine: validate -> acquire slot -> judge -> release.
class JudgeService {
  WorkerPool pool_;
  std::mutex inflight_mtx_;
  // submission id -> token of the judging request
  std::unordered_map<std::string, std::shared_ptr<CancelToken>> inflight_;

  std::shared_ptr<CancelToken> Register_(const std::string& submission_id);
  void Unregister_(const std::string& submission_id, const std::shared_ptr<CancelToken>&);
 public:
  JudgeService(int capacity, size_t max_queue, std::chrono::milliseconds max_wait) :
      pool_(capacity, max_queue, max_wait) {}

  // Blocks until the result is available or the request is rejected
  JudgeResponse Execute(JudgeRequest&&);
  // Return false if no such submission is in flight
  bool Cancel(const std::string& submission_id);
  WorkerPool::Stats PoolStats() const { return pool_.GetStats(); }
};

// Liveness probe; does not spawn any process
bool SandboxHealthy(std::string* reason = nullptr);

#endif  // INCLUDE_CODNITE_SERVICE_H_
