#ifndef RUNNER_H_
#define RUNNER_H_

#include <string>

#include <cjail/cjail.h>
#include <codnite/validator.h>
#include <codnite/submission.h>

// captured output returned to callers is truncated to these sizes (bytes)
constexpr size_t kMaxReportedOutput = 64 * 1024;
constexpr size_t kMaxReportedError = 4 * 1024;
constexpr size_t kMaxCompileMessage = 4000;

// limits applied to every test case of one submission
struct ExecutionLimits {
  long time_ms;
  long memory_kb;
  long output_kb;
  int proc_num;
};
ExecutionLimits EffectiveLimits(const JudgeRequest&, const LanguageDescriptor&);
// memory the cgroup of one run may hold: program, margin and the output files on tmpfs
long RunMemoryCeilingKb(const ExecutionLimits&);

struct ExecutionOutcome {
  std::string output; // complete stdout (bounded by the output ceiling)
  std::string error_output; // truncated to kMaxReportedError
  int exit_code;
  int signal;
  long elapsed_ms; // wall clock
  long cpu_ms;
  long peak_memory_kb;
  TerminationReason reason;
  std::string message;

  ExecutionOutcome() :
      exit_code(0), signal(0), elapsed_ms(0), cpu_ms(0), peak_memory_kb(0),
      reason(TerminationReason::NORMAL) {}
};

// Fill exit status, usage and termination reason from a raw sandbox result.
// Checks are ordered: a killed process is classified by why it was killed
//   before its exit status is considered.
void ClassifyExecution(const struct cjail_result&, const ExecutionLimits&, bool cancelled, ExecutionOutcome&);

struct CompileOutcome {
  bool success;
  bool cancelled;
  std::string message; // compiler diagnostics, filtered and truncated
};

// Unprivileged uid/gid leased for the whole judge run of one submission
class UidLease {
  int uid_;
 public:
  // throws std::runtime_error if every uid is in use
  UidLease();
  UidLease(const UidLease&) = delete;
  UidLease& operator=(const UidLease&) = delete;
  ~UidLease();
  int Uid() const { return uid_; }
};
constexpr int kUidBase = 50000, kUidPoolSize = 100;

// Scratch directory of one submission; removed with everything inside on destruction
class SubmissionBox {
  long id_;
 public:
  // throws std::runtime_error if the directory cannot be created
  explicit SubmissionBox(long id);
  SubmissionBox(const SubmissionBox&) = delete;
  SubmissionBox& operator=(const SubmissionBox&) = delete;
  ~SubmissionBox();
};

// Write the source and invoke the compiler if the language has one.
// Throws std::runtime_error if the sandbox itself fails.
CompileOutcome CompileSubmission(const ValidatedRequest&, int uid, const CancelToken* = nullptr);

// Run the compiled program on one test case in a fresh box.
// Never throws for anything the program does; sandbox failures are SANDBOX_ERROR.
ExecutionOutcome RunTestCase(const ValidatedRequest&, int index, int uid, const CancelToken* = nullptr);

#endif  // RUNNER_H_
