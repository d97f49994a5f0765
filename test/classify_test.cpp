#include <signal.h>
#include <sys/wait.h>
#include <gtest/gtest.h>
#include <codnite/language.h>
#include "runner.h"

namespace {

constexpr ExecutionLimits kLimits = {.time_ms = 1000, .memory_kb = 65536, .output_kb = 16384, .proc_num = 1};

struct cjail_result Exited(int code, long time_ms = 10, long rss_kb = 1024) {
  struct cjail_result res = {};
  res.info.si_code = CLD_EXITED;
  res.info.si_status = code;
  res.time.tv_sec = time_ms / 1000;
  res.time.tv_usec = time_ms % 1000 * 1000;
  res.rus.ru_utime = res.time;
  res.rus.ru_maxrss = rss_kb;
  return res;
}

struct cjail_result Killed(int sig, long time_ms = 10, long rss_kb = 1024) {
  struct cjail_result res = Exited(0, time_ms, rss_kb);
  res.info.si_code = CLD_KILLED;
  res.info.si_status = sig;
  return res;
}

ExecutionOutcome Classify(const struct cjail_result& res, bool cancelled = false) {
  ExecutionOutcome out;
  ClassifyExecution(res, kLimits, cancelled, out);
  return out;
}

} // namespace

TEST(ClassifyTest, Normal) {
  ExecutionOutcome out = Classify(Exited(0, 123, 2048));
  EXPECT_EQ(out.reason, TerminationReason::NORMAL);
  EXPECT_EQ(out.exit_code, 0);
  EXPECT_EQ(out.signal, 0);
  EXPECT_EQ(out.elapsed_ms, 123);
  EXPECT_EQ(out.cpu_ms, 123);
  EXPECT_EQ(out.peak_memory_kb, 2048);
  EXPECT_TRUE(out.message.empty());
}

TEST(ClassifyTest, NonZeroExit) {
  ExecutionOutcome out = Classify(Exited(3));
  EXPECT_EQ(out.reason, TerminationReason::RUNTIME_ERROR);
  EXPECT_EQ(out.exit_code, 3);
  EXPECT_EQ(out.message, "Exited with code 3");
}

TEST(ClassifyTest, Signal) {
  ExecutionOutcome out = Classify(Killed(SIGSEGV));
  EXPECT_EQ(out.reason, TerminationReason::SIGNAL_KILLED);
  EXPECT_EQ(out.signal, SIGSEGV);
  EXPECT_EQ(out.exit_code, 128 + SIGSEGV);
  EXPECT_NE(out.message.find("Killed by signal 11"), std::string::npos);
}

TEST(ClassifyTest, OutputLimit) {
  ExecutionOutcome out = Classify(Killed(SIGXFSZ));
  EXPECT_EQ(out.reason, TerminationReason::SIGNAL_KILLED);
  EXPECT_EQ(out.message, "Output limit exceeded");
}

TEST(ClassifyTest, WallClockKill) {
  struct cjail_result res = Killed(SIGKILL, 1200);
  res.timekill = 1;
  EXPECT_EQ(Classify(res).reason, TerminationReason::TIMEOUT);
}

TEST(ClassifyTest, CpuTimeOverLimit) {
  // exited by itself but used more CPU time than allowed
  struct cjail_result res = Exited(0, 900);
  res.rus.ru_utime.tv_sec = 1;
  res.rus.ru_utime.tv_usec = 20000;
  EXPECT_EQ(Classify(res).reason, TerminationReason::TIMEOUT);
  // exactly at the limit passes
  EXPECT_EQ(Classify(Exited(0, 1000)).reason, TerminationReason::NORMAL);
}

TEST(ClassifyTest, SignalOnCpuLimit) {
  // RLIMIT_CPU ends with SIGXCPU or SIGKILL but no timekill
  EXPECT_EQ(Classify(Killed(SIGKILL, 1100)).reason, TerminationReason::TIMEOUT);
  EXPECT_EQ(Classify(Killed(SIGXCPU, 900)).reason, TerminationReason::TIMEOUT);
  EXPECT_EQ(Classify(Killed(SIGKILL, 900)).reason, TerminationReason::SIGNAL_KILLED);
}

TEST(ClassifyTest, OomKill) {
  struct cjail_result res = Killed(SIGKILL, 50, 70000);
  res.oomkill = 1;
  EXPECT_EQ(Classify(res).reason, TerminationReason::MEMORY_EXCEEDED);
}

TEST(ClassifyTest, MemoryBeforeSignal) {
  // allocation failures often end with SIGABRT or SIGSEGV
  EXPECT_EQ(Classify(Killed(SIGABRT, 10, 70000)).reason, TerminationReason::MEMORY_EXCEEDED);
  EXPECT_EQ(Classify(Killed(SIGABRT, 10, 60000)).reason, TerminationReason::SIGNAL_KILLED);
}

TEST(ClassifyTest, MemoryBeforeExitCode) {
  EXPECT_EQ(Classify(Exited(1, 10, 70000)).reason, TerminationReason::MEMORY_EXCEEDED);
  EXPECT_EQ(Classify(Exited(0, 10, 65536)).reason, TerminationReason::NORMAL);
}

TEST(ClassifyTest, OomFailureIsIgnored) {
  // oomkill = -1 means the cgroup could not be read
  struct cjail_result res = Exited(0);
  res.oomkill = -1;
  EXPECT_EQ(Classify(res).reason, TerminationReason::NORMAL);
}

TEST(ClassifyTest, SandboxError) {
  struct cjail_result res = {};
  res.timekill = -1;
  ExecutionOutcome out = Classify(res);
  EXPECT_EQ(out.reason, TerminationReason::SANDBOX_ERROR);
  EXPECT_EQ(out.message, "Execution error");
}

TEST(ClassifyTest, CancelledWins) {
  struct cjail_result res = {};
  res.timekill = -1;
  EXPECT_EQ(Classify(res, true).reason, TerminationReason::CANCELLED);
  EXPECT_EQ(Classify(Exited(0), true).reason, TerminationReason::CANCELLED);
}

TEST(EffectiveLimitsTest, LanguageMultipliers) {
  JudgeRequest req;
  req.time_limit_seconds = 1.5;
  req.memory_limit_mb = 64;
  ExecutionLimits lim = EffectiveLimits(req, *FindLanguage("cpp"));
  EXPECT_EQ(lim.time_ms, 1500);
  EXPECT_EQ(lim.memory_kb, 64 * 1024);
  EXPECT_EQ(lim.output_kb, kMaxOutput);
  EXPECT_EQ(lim.proc_num, 1);
  lim = EffectiveLimits(req, *FindLanguage("java"));
  EXPECT_EQ(lim.time_ms, 1500);
  EXPECT_EQ(lim.memory_kb, 128 * 1024);
  EXPECT_GT(lim.proc_num, 1);
}

TEST(EffectiveLimitsTest, TimeLimitSameForEveryLanguage) {
  JudgeRequest req;
  req.time_limit_seconds = 2;
  for (auto& lang : Languages()) {
    EXPECT_EQ(EffectiveLimits(req, lang).time_ms, 2000) << lang.id;
  }
}

TEST(ClassifyTest, SleepPastLimitUnderTwoSeconds) {
  JudgeRequest req;
  req.time_limit_seconds = 2;
  ExecutionLimits lim = EffectiveLimits(req, *FindLanguage("python"));
  // exited cleanly after 3 s of wall time, almost no cpu
  struct cjail_result res = Exited(0, 3000);
  res.rus.ru_utime = {0, 20'000};
  ExecutionOutcome out;
  ClassifyExecution(res, lim, false, out);
  EXPECT_EQ(out.reason, TerminationReason::TIMEOUT);
}

TEST(EffectiveLimitsTest, MemoryCeiling) {
  long orig = kMaxRSS;
  kMaxRSS = 100 * 1024;
  JudgeRequest req;
  req.memory_limit_mb = 512;
  EXPECT_EQ(EffectiveLimits(req, *FindLanguage("c")).memory_kb, 100 * 1024);
  kMaxRSS = orig;
}
