#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <vector>
#include <utility>
#include <gtest/gtest.h>
#include <codnite/utils.h>
#include <codnite/submission.h>

// Integration tests need root and the sandbox helper next to the test binary
bool SandboxAvailable();
#define SKIP_WITHOUT_SANDBOX() \
  if (!SandboxAvailable()) GTEST_SKIP() << "Sandbox not available (needs root and sandbox-exec)"

// Every tool the language invokes through /usr/bin/env is on PATH
bool ToolchainAvailable(const std::string& lang);

class AssertVerdictReporter {
  bool has_overall_result_;
  bool require_tests_;
  size_t test_verdicts_;

  void AssertResult_() {
    ASSERT_TRUE(has_overall_result_);
    if (require_tests_) ASSERT_GT(test_verdicts_, 0u);
  }
 public:
  Verdict expect_verdict;

  AssertVerdictReporter(Verdict ver, bool require_tests = true) :
      has_overall_result_(false),
      require_tests_(require_tests),
      test_verdicts_(0),
      expect_verdict(ver) {}
  ~AssertVerdictReporter() { AssertResult_(); }

  void ReportOverallResult(const SubmissionResult& res) {
    ASSERT_EQ(res.verdict, expect_verdict) << VerdictToDesc(res.verdict);
    has_overall_result_ = true;
  }
  void ReportTestVerdict(const TestVerdict& verdict) {
    ASSERT_EQ(verdict.index, (int)test_verdicts_);
    test_verdicts_++;
  }

  JudgeRequest::Reporter GetReporter() {
    JudgeRequest::Reporter reporter;
    reporter.ReportOverallResult = [&](const JudgeRequest&, const SubmissionResult& res) {
      ReportOverallResult(res);
    };
    reporter.ReportTestVerdict = [&](const JudgeRequest&, const TestVerdict& verdict) {
      ReportTestVerdict(verdict);
    };
    return reporter;
  }
};

JudgeRequest MakeRequest(
    const std::string& lang, const std::string& code,
    const std::vector<std::pair<std::string, std::string>>& tests,
    double time_limit_seconds = 1, long memory_limit_mb = 64);

// Validate and judge in the calling thread; fails the test if validation fails
SubmissionResult RunSubmission(JudgeRequest&& req, const CancelToken* token = nullptr);

#endif // TEST_UTILS_H_
