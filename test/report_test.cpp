#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <codnite/report.h>
#include <codnite/utils.h>

namespace {

TestVerdict MakeVerdict(int index, Verdict status) {
  TestVerdict ret;
  ret.index = index;
  ret.status = status;
  ret.elapsed_ms = 10 * (index + 1);
  ret.memory_kb = 1000 * (index + 1);
  ret.actual_output = "out";
  ret.expected_output = "exp";
  return ret;
}

} // namespace

TEST(ReportTest, TestVerdictShape) {
  TestVerdict verdict = MakeVerdict(2, Verdict::RUNTIME_ERROR);
  verdict.reason = TerminationReason::SIGNAL_KILLED;
  verdict.signal = 11;
  verdict.exit_code = 139;
  verdict.error_output = "segfault";
  verdict.message = "Killed by signal 11 (Segmentation fault)";
  nlohmann::json obj = TestVerdictToJson(verdict);
  EXPECT_EQ(obj["testCase"], 3);
  EXPECT_EQ(obj["index"], 2);
  EXPECT_EQ(obj["status"], "RuntimeError");
  EXPECT_EQ(obj["passed"], false);
  EXPECT_EQ(obj["reason"], "signal-killed");
  EXPECT_EQ(obj["elapsedMs"], 30);
  EXPECT_EQ(obj["memoryKb"], 3000);
  EXPECT_EQ(obj["exitCode"], 139);
  EXPECT_EQ(obj["signal"], 11);
  EXPECT_EQ(obj["actualOutput"], "out");
  EXPECT_EQ(obj["expectedOutput"], "exp");
  EXPECT_EQ(obj["error"], "segfault");
  EXPECT_EQ(obj["message"], "Killed by signal 11 (Segmentation fault)");
}

TEST(ReportTest, OptionalFieldsOmitted) {
  nlohmann::json obj = TestVerdictToJson(MakeVerdict(0, Verdict::PASSED));
  EXPECT_EQ(obj["passed"], true);
  EXPECT_EQ(obj["status"], "Passed");
  EXPECT_FALSE(obj.contains("error"));
  EXPECT_FALSE(obj.contains("message"));
  EXPECT_FALSE(obj.contains("signal"));
}

TEST(ReportTest, SubmissionResultShape) {
  SubmissionResult res;
  res.verdict = Verdict::WRONG_ANSWER;
  res.test_verdicts = {MakeVerdict(0, Verdict::PASSED), MakeVerdict(1, Verdict::WRONG_ANSWER),
                       MakeVerdict(2, Verdict::PASSED)};
  res.passed_count = 2;
  res.max_elapsed_ms = 30;
  res.max_memory_kb = 3000;
  nlohmann::json obj = SubmissionResultToJson(res);
  EXPECT_EQ(obj["status"], "rejected");
  EXPECT_EQ(obj["overallStatus"], "WrongAnswer");
  EXPECT_DOUBLE_EQ(obj["score"].get<double>(), 66.67);
  EXPECT_EQ(obj["passedTests"], 2);
  EXPECT_EQ(obj["totalTests"], 3);
  EXPECT_EQ(obj["maxElapsedMs"], 30);
  EXPECT_EQ(obj["maxMemoryKb"], 3000);
  ASSERT_EQ(obj["results"].size(), 3u);
  EXPECT_EQ(obj["results"][1]["status"], "WrongAnswer");
  EXPECT_FALSE(obj.contains("compileError"));
}

TEST(ReportTest, AcceptedSubmission) {
  SubmissionResult res;
  res.verdict = Verdict::PASSED;
  res.test_verdicts = {MakeVerdict(0, Verdict::PASSED)};
  res.passed_count = 1;
  nlohmann::json obj = SubmissionResultToJson(res);
  EXPECT_EQ(obj["status"], "accepted");
  EXPECT_DOUBLE_EQ(obj["score"].get<double>(), 100);
}

TEST(ReportTest, CompileErrorShape) {
  SubmissionResult res;
  res.verdict = Verdict::COMPILE_ERROR;
  res.compile_error = "prog.cpp:1:1: error";
  nlohmann::json obj = SubmissionResultToJson(res);
  EXPECT_EQ(obj["status"], "rejected");
  EXPECT_EQ(obj["overallStatus"], "CompileError");
  EXPECT_EQ(obj["compileError"], "prog.cpp:1:1: error");
  EXPECT_EQ(obj["totalTests"], 0);
  EXPECT_DOUBLE_EQ(obj["score"].get<double>(), 0);
  EXPECT_TRUE(obj["results"].is_array());
  EXPECT_TRUE(obj["results"].empty());
}

TEST(ReportTest, LanguageShape) {
  nlohmann::json obj = LanguageToJson(*FindLanguage("javascript"));
  EXPECT_EQ(obj["id"], "javascript");
  EXPECT_EQ(obj["extension"], ".js");
  EXPECT_EQ(obj["compiled"], false);
  EXPECT_DOUBLE_EQ(obj["timeMultiplier"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(obj["memoryMultiplier"].get<double>(), 2.0);
}

TEST(ReportTest, ErrorsHideInternalDetails) {
  nlohmann::json obj = ErrorToJson(JudgeStatus::INTERNAL_ERROR, "/tmp/codnite_box/000001: permission denied");
  EXPECT_EQ(obj["error"], "Internal server error");
  EXPECT_EQ(obj["details"].get<std::string>().find("/tmp"), std::string::npos);
  obj = ErrorToJson(JudgeStatus::VALIDATION_ERROR, "Unsupported language: cobol");
  EXPECT_EQ(obj["details"], "Unsupported language: cobol");
}

TEST(ReportTest, HttpStatusCodes) {
  EXPECT_EQ(HttpStatusCode(JudgeStatus::OK), 200);
  EXPECT_EQ(HttpStatusCode(JudgeStatus::VALIDATION_ERROR), 400);
  EXPECT_EQ(HttpStatusCode(JudgeStatus::OVERLOADED), 503);
  EXPECT_EQ(HttpStatusCode(JudgeStatus::CANCELLED), 409);
  EXPECT_EQ(HttpStatusCode(JudgeStatus::INTERNAL_ERROR), 500);
}

TEST(RequestParseTest, FullRequest) {
  auto body = nlohmann::json::parse(R"json({
    "code": "print(input())",
    "language": "python",
    "submissionId": 42,
    "timeLimit": 2.5,
    "memoryLimit": 128,
    "failFast": true,
    "testCases": [
      {"input": "1\n", "expectedOutput": "1\n"},
      {"input": "2\n", "expectedOutput": "2.0\n", "compareMode": "float", "tolerance": 0.001}
    ]
  })json");
  JudgeRequest req;
  std::string details;
  ASSERT_TRUE(JudgeRequestFromJson(body, req, details)) << details;
  EXPECT_EQ(req.code, "print(input())");
  EXPECT_EQ(req.language_id, "python");
  EXPECT_EQ(req.submission_id, "42");
  EXPECT_DOUBLE_EQ(req.time_limit_seconds, 2.5);
  EXPECT_EQ(req.memory_limit_mb, 128);
  EXPECT_TRUE(req.fail_fast);
  ASSERT_EQ(req.test_cases.size(), 2u);
  EXPECT_EQ(req.test_cases[0].input, "1\n");
  EXPECT_EQ(req.test_cases[0].compare.mode, CompareMode::LINE);
  EXPECT_EQ(req.test_cases[1].compare.mode, CompareMode::FLOAT);
  EXPECT_NEAR((double)req.test_cases[1].compare.tolerance, 0.001, 1e-12);
}

TEST(RequestParseTest, Defaults) {
  JudgeRequest req;
  std::string details;
  ASSERT_TRUE(JudgeRequestFromJson(nlohmann::json::parse(R"({"code":"x","language":"c"})"), req, details));
  EXPECT_DOUBLE_EQ(req.time_limit_seconds, 5);
  EXPECT_EQ(req.memory_limit_mb, 64);
  EXPECT_EQ(req.fail_fast, kFailFast);
  EXPECT_TRUE(req.submission_id.empty());
  EXPECT_TRUE(req.test_cases.empty());
}

TEST(RequestParseTest, NullFieldsAreAbsent) {
  JudgeRequest req;
  std::string details;
  ASSERT_TRUE(JudgeRequestFromJson(
      nlohmann::json::parse(R"({"code":"x","language":"c","timeLimit":null,"submissionId":null})"), req, details));
  EXPECT_DOUBLE_EQ(req.time_limit_seconds, 5);
}

TEST(RequestParseTest, WrongTypes) {
  const char* bodies[] = {
    R"([1, 2])",
    R"("code")",
    R"({"code": 1})",
    R"({"language": ["c"]})",
    R"({"timeLimit": "5"})",
    R"({"memoryLimit": true})",
    R"({"failFast": 1})",
    R"({"submissionId": 1.5})",
    R"({"testCases": {}})",
    R"({"testCases": [1]})",
    R"({"testCases": [{"input": 1}]})",
    R"({"testCases": [{"expectedOutput": null, "compareMode": "fuzzy"}]})",
    R"({"testCases": [{"tolerance": "small"}]})",
  };
  for (const char* body : bodies) {
    JudgeRequest req;
    std::string details;
    EXPECT_FALSE(JudgeRequestFromJson(nlohmann::json::parse(body), req, details)) << body;
    EXPECT_FALSE(details.empty()) << body;
  }
}

TEST(NameTest, VerdictNames) {
  EXPECT_STREQ(VerdictToDesc(Verdict::TIME_LIMIT_EXCEEDED), "TimeLimitExceeded");
  EXPECT_STREQ(VerdictToAbr(Verdict::MEMORY_LIMIT_EXCEEDED), "MLE");
  EXPECT_STREQ(VerdictToDesc(Verdict::SKIPPED), "Skipped");
  EXPECT_STREQ(TerminationReasonName(TerminationReason::TIMEOUT), "timeout");
  EXPECT_STREQ(JudgeStatusName(JudgeStatus::OVERLOADED), "OVERLOADED");
}
