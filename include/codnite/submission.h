#ifndef INCLUDE_CODNITE_SUBMISSION_H_
#define INCLUDE_CODNITE_SUBMISSION_H_

#include <atomic>
#include <string>
#include <vector>
#include <functional>

#include "verdict.h"
#include "compare.h"

// KiB
extern long kMaxRSS;
extern long kMaxOutput;
// Real time * kTimeMultiplier = Indicated time
extern double kTimeMultiplier;
// default fail-fast policy of new requests
extern bool kFailFast;

class CancelToken {
  std::atomic_bool cancelled_;
 public:
  CancelToken() : cancelled_(false) {}
  void Cancel() { cancelled_ = true; }
  bool IsCancelled() const { return cancelled_; }
};

struct TestCase {
  std::string input, expected_output;
  CompareOptions compare;
};

struct TestVerdict;
class SubmissionResult;

class JudgeRequest {
 public:
  // use for box management; must be unique in a run (assigned by Validate if zero)
  long submission_internal_id;
  // caller-supplied id, only used for cancellation; may be empty
  std::string submission_id;

  std::string code;
  std::string language_id;
  std::vector<TestCase> test_cases;
  // uniform for all test cases
  double time_limit_seconds;
  long memory_limit_mb;
  // stop at the first non-passed test case; remaining ones are reported as SKIPPED
  bool fail_fast;

  struct Reporter {
    // these functions should not block
    std::function<void(const JudgeRequest&)> ReportStartCompiling;
    std::function<void(const JudgeRequest&, const SubmissionResult&)> ReportCompileError;
    std::function<void(const JudgeRequest&, const TestVerdict&)> ReportTestVerdict;
    std::function<void(const JudgeRequest&, const SubmissionResult&)> ReportOverallResult;
  };
  Reporter reporter; // callbacks for progress reporting

  JudgeRequest() :
      submission_internal_id(0),
      time_limit_seconds(5),
      memory_limit_mb(64),
      fail_fast(kFailFast) {}
};

struct TestVerdict {
  int index;
  Verdict status;
  TerminationReason reason;
  long elapsed_ms;
  long memory_kb;
  int exit_code;
  int signal;
  std::string actual_output; // truncated
  std::string expected_output;
  std::string error_output; // stderr, truncated
  std::string message;

  TestVerdict() :
      index(0), status(Verdict::NUL), reason(TerminationReason::NORMAL),
      elapsed_ms(0), memory_kb(0), exit_code(0), signal(0) {}
};

class SubmissionResult {
 public:
  Verdict verdict;
  // empty iff verdict == COMPILE_ERROR; otherwise one entry per test case in order
  std::vector<TestVerdict> test_verdicts;
  long max_elapsed_ms;
  long max_memory_kb;
  int passed_count;
  std::string compile_error;

  SubmissionResult() : verdict(Verdict::NUL), max_elapsed_ms(0), max_memory_kb(0), passed_count(0) {}
};

class ValidatedRequest;

// Drive compilation and every test case of one submission in the calling thread.
// Throws std::runtime_error only if the engine itself fails (box setup, uid exhaustion).
SubmissionResult JudgeSubmission(const ValidatedRequest&, const CancelToken* = nullptr);

// Largest cgroup memory ceiling (KiB) of one test run when requests may ask for
//   up to max_memory_limit_mb, over every language
long MaxRunMemoryKb(long max_memory_limit_mb);

#endif  // INCLUDE_CODNITE_SUBMISSION_H_
