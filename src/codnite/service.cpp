#include <codnite/service.h>

#include <unistd.h>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <codnite/utils.h>
#include <codnite/validator.h>
#include "paths.h"
#include "file_utils.h"

std::shared_ptr<CancelToken> JudgeService::Register_(const std::string& submission_id) {
  auto token = std::make_shared<CancelToken>();
  if (submission_id.empty()) return token;
  std::lock_guard lck(inflight_mtx_);
  auto& entry = inflight_[submission_id];
  if (entry) {
    // a resubmission supersedes the one still running
    spdlog::info("Duplicated submission id {}; cancelling the earlier one", submission_id);
    entry->Cancel();
  }
  entry = token;
  return token;
}

void JudgeService::Unregister_(const std::string& submission_id, const std::shared_ptr<CancelToken>& token) {
  if (submission_id.empty()) return;
  std::lock_guard lck(inflight_mtx_);
  if (auto it = inflight_.find(submission_id); it != inflight_.end() && it->second == token) {
    inflight_.erase(it);
  }
}

bool JudgeService::Cancel(const std::string& submission_id) {
  std::lock_guard lck(inflight_mtx_);
  auto it = inflight_.find(submission_id);
  if (it == inflight_.end()) return false;
  spdlog::info("Cancelling submission {}", submission_id);
  it->second->Cancel();
  return true;
}

JudgeResponse JudgeService::Execute(JudgeRequest&& request) {
  JudgeResponse resp;
  resp.status = JudgeStatus::OK;
  auto validated = Validate(std::move(request));
  if (auto* err = std::get_if<ValidationError>(&validated)) {
    spdlog::info("Validation failed: reason={} details={}", ValidationFailureName(err->failure), err->details);
    resp.status = JudgeStatus::VALIDATION_ERROR;
    resp.details = std::move(err->details);
    return resp;
  }
  const ValidatedRequest& vreq = std::get<ValidatedRequest>(validated);
  const long id = vreq.Request().submission_internal_id;
  const std::string submission_id = vreq.Request().submission_id;

  auto token = Register_(submission_id);
  struct InflightGuard {
    JudgeService* self;
    const std::string& submission_id;
    const std::shared_ptr<CancelToken>& token;
    ~InflightGuard() { self->Unregister_(submission_id, token); }
  } inflight_guard{this, submission_id, token};

  WorkerPool::Slot slot = pool_.Acquire(token.get());
  switch (slot.Status()) {
    case AcquireStatus::ACQUIRED: break;
    case AcquireStatus::QUEUE_FULL: [[fallthrough]];
    case AcquireStatus::QUEUE_TIMEOUT: {
      spdlog::warn("Submission rejected: id={} reason={}", id, AcquireStatusName(slot.Status()));
      resp.status = JudgeStatus::OVERLOADED;
      return resp;
    }
    case AcquireStatus::CANCELLED: {
      resp.status = JudgeStatus::CANCELLED;
      return resp;
    }
  }
  spdlog::info("Slot acquired: id={} sub_id={}", id, submission_id);
  try {
    resp.result = JudgeSubmission(vreq, token.get());
  } catch (std::exception& e) {
    spdlog::error("Internal error while judging: id={} sub_id={} lang={} what={}",
                  id, submission_id, vreq.Language().id, e.what());
    resp.status = JudgeStatus::INTERNAL_ERROR;
    return resp;
  }
  if (token->IsCancelled()) {
    spdlog::info("Submission cancelled: id={} sub_id={}", id, submission_id);
    resp.status = JudgeStatus::CANCELLED;
  }
  return resp;
}

bool SandboxHealthy(std::string* reason) {
  auto Fail = [&](std::string msg) {
    if (reason) *reason = std::move(msg);
    return false;
  };
  if (access(SandboxExecPath().c_str(), X_OK) != 0) return Fail("sandbox helper is not executable");
  std::error_code ec;
  if (!fs::is_directory(kBoxRoot, ec) && !CreateDirs(kBoxRoot)) return Fail("box root cannot be created");
  if (access(kBoxRoot.c_str(), W_OK) != 0) return Fail("box root is not writable");
  return true;
}
