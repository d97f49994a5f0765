#include <codnite/submission.h>

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <codnite/utils.h>
#include <codnite/validator.h>
#include "runner.h"

long kMaxRSS = 2 * 1024 * 1024; // 2G
long kMaxOutput = 16 * 1024; // 16M
double kTimeMultiplier = 1.0;
bool kFailFast = false;

namespace {

inline void Transition(long id, JudgeState& state, JudgeState next) {
  spdlog::info("Submission state: id={} {} -> {}", id, JudgeStateName(state), JudgeStateName(next));
  state = next;
}

// the result owns a fresh buffer sized to its content
inline std::string Truncate(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return std::string(str);
  return str.substr(0, max_len) + "\n[truncated]";
}

TestVerdict JudgeTestCase(const ValidatedRequest& vreq, int index, int uid, const CancelToken* token) {
  const JudgeRequest& req = vreq.Request();
  const TestCase& test = req.test_cases[index];
  ExecutionOutcome out = RunTestCase(vreq, index, uid, token);

  TestVerdict ret;
  ret.index = index;
  ret.reason = out.reason;
  ret.elapsed_ms = out.elapsed_ms;
  ret.memory_kb = out.peak_memory_kb;
  ret.exit_code = out.exit_code;
  ret.signal = out.signal;
  ret.error_output = std::move(out.error_output);
  ret.message = std::move(out.message);
  ret.expected_output = Truncate(test.expected_output, kMaxReportedOutput);
  switch (out.reason) {
    case TerminationReason::NORMAL: {
      std::string message;
      ret.status = Compare(out.output, test.expected_output, test.compare, &message);
      if (ret.status != Verdict::PASSED) ret.message = std::move(message);
      break;
    }
    case TerminationReason::TIMEOUT: ret.status = Verdict::TIME_LIMIT_EXCEEDED; break;
    case TerminationReason::MEMORY_EXCEEDED: ret.status = Verdict::MEMORY_LIMIT_EXCEEDED; break;
    case TerminationReason::RUNTIME_ERROR: [[fallthrough]];
    case TerminationReason::SIGNAL_KILLED: ret.status = Verdict::RUNTIME_ERROR; break;
    case TerminationReason::SANDBOX_ERROR: {
      spdlog::error("Sandbox failure: id={} test={}", req.submission_internal_id, index);
      ret.status = Verdict::RUNTIME_ERROR;
      break;
    }
    case TerminationReason::CANCELLED: ret.status = Verdict::SKIPPED; break;
  }
  ret.actual_output = Truncate(out.output, kMaxReportedOutput);
  return ret;
}

} // namespace

SubmissionResult JudgeSubmission(const ValidatedRequest& vreq, const CancelToken* token) {
  const JudgeRequest& req = vreq.Request();
  const JudgeRequest::Reporter& reporter = req.reporter;
  long id = req.submission_internal_id;
  JudgeState state = JudgeState::VALIDATING;
  SubmissionResult res;
  spdlog::info("Submission start: id={} sub_id={} lang={} tests={} time={} memory={} fail_fast={}",
               id, req.submission_id, vreq.Language().id, req.test_cases.size(),
               req.time_limit_seconds, req.memory_limit_mb, req.fail_fast);

  UidLease uid;
  SubmissionBox box(id);

  Transition(id, state, JudgeState::COMPILING);
  if (reporter.ReportStartCompiling) reporter.ReportStartCompiling(req);
  CompileOutcome compile = CompileSubmission(vreq, uid.Uid(), token);
  if (!compile.success && !compile.cancelled) {
    res.verdict = Verdict::COMPILE_ERROR;
    res.compile_error = std::move(compile.message);
    if (reporter.ReportCompileError) reporter.ReportCompileError(req, res);
    Transition(id, state, JudgeState::AGGREGATING);
    Transition(id, state, JudgeState::DONE);
    if (reporter.ReportOverallResult) reporter.ReportOverallResult(req, res);
    return res;
  }

  Transition(id, state, JudgeState::RUNNING);
  bool stop = compile.cancelled;
  for (int i = 0; i < (int)req.test_cases.size(); i++) {
    TestVerdict verdict;
    if (stop || (token && token->IsCancelled())) {
      verdict.index = i;
      verdict.status = Verdict::SKIPPED;
      verdict.expected_output = Truncate(req.test_cases[i].expected_output, kMaxReportedOutput);
    } else {
      try {
        verdict = JudgeTestCase(vreq, i, uid.Uid(), token);
      } catch (std::exception& e) {
        spdlog::error("Unexpected error while running test case: id={} test={} what={}", id, i, e.what());
        verdict = TestVerdict();
        verdict.index = i;
        verdict.status = Verdict::RUNTIME_ERROR;
        verdict.reason = TerminationReason::SANDBOX_ERROR;
        verdict.message = "Execution error";
        verdict.expected_output = Truncate(req.test_cases[i].expected_output, kMaxReportedOutput);
      }
      if (verdict.status == Verdict::SKIPPED) {
        stop = true;
      } else if (verdict.status != Verdict::PASSED && req.fail_fast) {
        spdlog::info("Fail-fast: id={} stopped at test={} verdict={}", id, i, VerdictToAbr(verdict.status));
        stop = true;
      }
    }
    if (reporter.ReportTestVerdict) reporter.ReportTestVerdict(req, verdict);
    res.test_verdicts.push_back(std::move(verdict));
  }

  Transition(id, state, JudgeState::AGGREGATING);
  res.verdict = Verdict::PASSED;
  bool skipped = false;
  for (auto& verdict : res.test_verdicts) {
    res.max_elapsed_ms = std::max(res.max_elapsed_ms, verdict.elapsed_ms);
    res.max_memory_kb = std::max(res.max_memory_kb, verdict.memory_kb);
    if (verdict.status == Verdict::PASSED) res.passed_count++;
    if (verdict.status == Verdict::SKIPPED) {
      skipped = true;
    } else {
      res.verdict = std::max(res.verdict, verdict.status);
    }
  }
  // Passed only if every test case passed
  if (skipped && res.verdict == Verdict::PASSED) res.verdict = Verdict::SKIPPED;
  Transition(id, state, JudgeState::DONE);
  spdlog::info("Submission finished: id={} verdict={} passed={}/{} time={} memory={}",
               id, VerdictToAbr(res.verdict), res.passed_count, res.test_verdicts.size(),
               res.max_elapsed_ms, res.max_memory_kb);
  if (reporter.ReportOverallResult) reporter.ReportOverallResult(req, res);
  return res;
}
