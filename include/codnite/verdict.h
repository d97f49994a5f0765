#ifndef INCLUDE_CODNITE_VERDICT_H_
#define INCLUDE_CODNITE_VERDICT_H_

// the max of every test case would be the overall result
#define ENUM_VERDICT_ \
  X(NUL, "", "Nil") \
  /* only produced when a fail-fast run stops early or the submission is cancelled */ \
  X(SKIPPED, "SKIP", "Skipped") \
  X(PASSED, "AC", "Passed") \
  X(WRONG_ANSWER, "WA", "WrongAnswer") \
  X(TIME_LIMIT_EXCEEDED, "TLE", "TimeLimitExceeded") \
  X(MEMORY_LIMIT_EXCEEDED, "MLE", "MemoryLimitExceeded") \
  X(RUNTIME_ERROR, "RE", "RuntimeError") \
  /* verdicts after compilation */ \
  X(COMPILE_ERROR, "CE", "CompileError")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

#define ENUM_TERMINATION_REASON_ \
  X(NORMAL, "normal") \
  X(TIMEOUT, "timeout") \
  X(MEMORY_EXCEEDED, "memory-exceeded") \
  X(RUNTIME_ERROR, "runtime-error") \
  X(SIGNAL_KILLED, "signal-killed") \
  X(SANDBOX_ERROR, "sandbox-error") \
  X(CANCELLED, "cancelled")
enum class TerminationReason {
#define X(name, desc) name,
  ENUM_TERMINATION_REASON_
#undef X
};

#define ENUM_COMPARE_MODE_ \
  X(LINE, "line") \
  X(STRICT, "strict") \
  X(WHITESPACE, "whitespace") \
  X(FLOAT, "float")
enum class CompareMode {
#define X(name, desc) name,
  ENUM_COMPARE_MODE_
#undef X
};

// outcome of a judge call as seen by the caller; http code in the second column
#define ENUM_JUDGE_STATUS_ \
  X(OK, 200) \
  X(VALIDATION_ERROR, 400) \
  X(OVERLOADED, 503) \
  X(CANCELLED, 409) \
  X(INTERNAL_ERROR, 500)
enum class JudgeStatus {
#define X(name, code) name,
  ENUM_JUDGE_STATUS_
#undef X
};

#define ENUM_JUDGE_STATE_ \
  X(VALIDATING) \
  X(COMPILING) \
  X(RUNNING) \
  X(AGGREGATING) \
  X(DONE)
enum class JudgeState {
#define X(name) name,
  ENUM_JUDGE_STATE_
#undef X
};

#endif  // INCLUDE_CODNITE_VERDICT_H_
