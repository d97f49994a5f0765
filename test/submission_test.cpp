#include <filesystem>
#include <codnite/utils.h>
#include <codnite/paths.h>

#include "utils.h"

namespace {

struct SubParam {
  std::string lang;
  std::string code;
};

std::string ParamName(const ::testing::TestParamInfo<SubParam>& info) {
  return info.param.lang;
}

} // namespace

class EchoSubmission : public testing::TestWithParam<SubParam> {};
TEST_P(EchoSubmission, Sub) {
  SKIP_WITHOUT_SANDBOX();
  auto& param = GetParam();
  if (!ToolchainAvailable(param.lang)) GTEST_SKIP() << "No toolchain for " << param.lang;
  AssertVerdictReporter reporter(Verdict::PASSED);
  JudgeRequest req = MakeRequest(param.lang, param.code, {{"3\n", "3\n"}, {"-12\n", "-12"}, {"0", "0\n\n"}}, 5, 256);
  req.reporter = reporter.GetReporter();
  SubmissionResult res = RunSubmission(std::move(req));
  ASSERT_EQ(res.test_verdicts.size(), 3u);
  EXPECT_EQ(res.passed_count, 3);
  for (auto& verdict : res.test_verdicts) {
    EXPECT_EQ(verdict.status, Verdict::PASSED) << verdict.message << verdict.error_output;
    EXPECT_EQ(verdict.reason, TerminationReason::NORMAL);
    EXPECT_EQ(verdict.exit_code, 0);
    EXPECT_GT(verdict.memory_kb, 0);
  }
  EXPECT_EQ(res.test_verdicts[1].actual_output.find("-12"), 0u);
}
INSTANTIATE_TEST_SUITE_P(OneSubmission, EchoSubmission,
    testing::Values(
      (SubParam){"c", R"(#include <stdio.h>
int main(){ int a; scanf("%d",&a); printf("%d\n",a); })"},
      (SubParam){"cpp", R"(#include <cstdio>
int main(){ int a; scanf("%d",&a);printf("%d",a); })"},
      (SubParam){"python", "print(input())"},
      (SubParam){"javascript", "process.stdout.write(require('fs').readFileSync(0, 'utf8'));"},
      (SubParam){"java", R"(import java.util.*;
public class Main {
  public static void main(String[] args) {
    Scanner sc = new Scanner(System.in);
    System.out.println(sc.nextInt());
  }
})"}
    ),
    ParamName);

TEST(SubmissionTest, StderrIsCaptured) {
  SKIP_WITHOUT_SANDBOX();
  SubmissionResult res = RunSubmission(MakeRequest("cpp", R"(#include <cstdio>
int main(){ fputs("debug", stderr); puts("ok"); })", {{"", "ok"}}));
  ASSERT_EQ(res.test_verdicts.size(), 1u);
  EXPECT_EQ(res.verdict, Verdict::PASSED);
  EXPECT_EQ(res.test_verdicts[0].error_output, "debug");
}

TEST(SubmissionTest, LargeInput) {
  SKIP_WITHOUT_SANDBOX();
  std::string input;
  for (int i = 0; i < 200000; i++) input += std::to_string(i) + '\n';
  SubmissionResult res = RunSubmission(MakeRequest("cpp", R"(#include <cstdio>
int main(){ long s = 0, x; while (scanf("%ld", &x) == 1) s += x; printf("%ld\n", s); })",
      {{input, "19999900000\n"}}));
  EXPECT_EQ(res.verdict, Verdict::PASSED);
}

TEST(SubmissionTest, OutputBuffersAreSizedToOutput) {
  SKIP_WITHOUT_SANDBOX();
  std::vector<std::pair<std::string, std::string>> tests(50, {"", "1\n"});
  SubmissionResult res = RunSubmission(MakeRequest("cpp", "#include <cstdio>\nint main(){ puts(\"1\"); }", tests));
  ASSERT_EQ(res.test_verdicts.size(), 50u);
  EXPECT_EQ(res.verdict, Verdict::PASSED);
  for (auto& verdict : res.test_verdicts) {
    EXPECT_EQ(verdict.actual_output, "1\n");
    EXPECT_LT(verdict.actual_output.capacity(), 4096u);
  }
}

TEST(SubmissionTest, ProgressReports) {
  SKIP_WITHOUT_SANDBOX();
  JudgeRequest req = MakeRequest("cpp", "#include <cstdio>\nint main(){ puts(\"1\"); }",
                                 {{"", "1"}, {"", "2"}, {"", "1"}});
  std::vector<std::string> events;
  req.reporter.ReportStartCompiling = [&](const JudgeRequest&) { events.push_back("compile"); };
  req.reporter.ReportTestVerdict = [&](const JudgeRequest&, const TestVerdict& verdict) {
    events.push_back(std::string("test") + VerdictToAbr(verdict.status));
  };
  req.reporter.ReportOverallResult = [&](const JudgeRequest&, const SubmissionResult& res) {
    events.push_back(std::string("overall") + VerdictToAbr(res.verdict));
  };
  SubmissionResult res = RunSubmission(std::move(req));
  EXPECT_EQ(events, (std::vector<std::string>{"compile", "testAC", "testWA", "testAC", "overallWA"}));
  EXPECT_EQ(res.passed_count, 2);
}

TEST(SubmissionTest, BoxIsRemoved) {
  SKIP_WITHOUT_SANDBOX();
  JudgeRequest req = MakeRequest("c", "int main(){ return 0; }", {{"", ""}});
  req.submission_internal_id = GetUniqueSubmissionInternalId();
  long id = req.submission_internal_id;
  SubmissionResult res = RunSubmission(std::move(req));
  EXPECT_EQ(res.verdict, Verdict::PASSED);
  EXPECT_FALSE(std::filesystem::exists(SubmissionRunPath(id)));
}
