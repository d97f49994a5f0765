#include <codnite/report.h>

#include <cmath>
#include <nlohmann/json.hpp>
#include <codnite/utils.h>

namespace {

// nullptr if absent or null
inline const nlohmann::json* Field(const nlohmann::json& obj, const char* name) {
  auto it = obj.find(name);
  if (it == obj.end() || it->is_null()) return nullptr;
  return &*it;
}

bool TestCaseFromJson(const nlohmann::json& obj, size_t index, TestCase& test, std::string& details) {
  if (!obj.is_object()) {
    details = "testCases[" + std::to_string(index) + "] must be an object";
    return false;
  }
  auto GetString = [&](const char* name, std::string& target) {
    const nlohmann::json* field = Field(obj, name);
    if (!field) return true;
    if (!field->is_string()) {
      details = "testCases[" + std::to_string(index) + "]." + name + " must be a string";
      return false;
    }
    target = field->get<std::string>();
    return true;
  };
  if (!GetString("input", test.input) || !GetString("expectedOutput", test.expected_output)) return false;
  std::string mode;
  if (!GetString("compareMode", mode)) return false;
  if (!mode.empty() && !GetCompareMode(mode, test.compare.mode)) {
    details = "testCases[" + std::to_string(index) + "].compareMode is not recognized: " + mode;
    return false;
  }
  if (const nlohmann::json* field = Field(obj, "tolerance")) {
    if (!field->is_number()) {
      details = "testCases[" + std::to_string(index) + "].tolerance must be a number";
      return false;
    }
    test.compare.tolerance = field->get<long double>();
  }
  return true;
}

} // namespace

bool JudgeRequestFromJson(const nlohmann::json& body, JudgeRequest& req, std::string& details) {
  if (!body.is_object()) {
    details = "Request body must be a JSON object";
    return false;
  }
  auto GetString = [&](const char* name, std::string& target) {
    const nlohmann::json* field = Field(body, name);
    if (!field) return true;
    if (!field->is_string()) {
      details = std::string(name) + " must be a string";
      return false;
    }
    target = field->get<std::string>();
    return true;
  };
  if (!GetString("code", req.code) || !GetString("language", req.language_id)) return false;
  if (const nlohmann::json* field = Field(body, "submissionId")) {
    if (field->is_string()) {
      req.submission_id = field->get<std::string>();
    } else if (field->is_number_integer()) {
      req.submission_id = std::to_string(field->get<long>());
    } else {
      details = "submissionId must be a string or an integer";
      return false;
    }
  }
  if (const nlohmann::json* field = Field(body, "timeLimit")) {
    if (!field->is_number()) {
      details = "timeLimit must be a number";
      return false;
    }
    req.time_limit_seconds = field->get<double>();
  }
  if (const nlohmann::json* field = Field(body, "memoryLimit")) {
    if (!field->is_number()) {
      details = "memoryLimit must be a number";
      return false;
    }
    req.memory_limit_mb = std::lround(field->get<double>());
  }
  if (const nlohmann::json* field = Field(body, "failFast")) {
    if (!field->is_boolean()) {
      details = "failFast must be a boolean";
      return false;
    }
    req.fail_fast = field->get<bool>();
  }
  if (const nlohmann::json* field = Field(body, "testCases")) {
    if (!field->is_array()) {
      details = "testCases must be an array";
      return false;
    }
    req.test_cases.resize(field->size());
    for (size_t i = 0; i < field->size(); i++) {
      if (!TestCaseFromJson((*field)[i], i, req.test_cases[i], details)) return false;
    }
  }
  return true;
}

nlohmann::json TestVerdictToJson(const TestVerdict& verdict) {
  nlohmann::json ret = {
    {"testCase", verdict.index + 1},
    {"index", verdict.index},
    {"status", VerdictToDesc(verdict.status)},
    {"passed", verdict.status == Verdict::PASSED},
    {"reason", TerminationReasonName(verdict.reason)},
    {"elapsedMs", verdict.elapsed_ms},
    {"memoryKb", verdict.memory_kb},
    {"exitCode", verdict.exit_code},
    {"actualOutput", verdict.actual_output},
    {"expectedOutput", verdict.expected_output},
  };
  if (verdict.signal) ret["signal"] = verdict.signal;
  if (!verdict.error_output.empty()) ret["error"] = verdict.error_output;
  if (!verdict.message.empty()) ret["message"] = verdict.message;
  return ret;
}

nlohmann::json SubmissionResultToJson(const SubmissionResult& res) {
  nlohmann::json results = nlohmann::json::array();
  for (auto& verdict : res.test_verdicts) results.push_back(TestVerdictToJson(verdict));
  size_t total = res.test_verdicts.size();
  double score = total ? std::round(100.0 * res.passed_count / total * 100) / 100 : 0.0;
  nlohmann::json ret = {
    {"status", res.verdict == Verdict::PASSED ? "accepted" : "rejected"},
    {"overallStatus", VerdictToDesc(res.verdict)},
    {"score", score},
    {"passedTests", res.passed_count},
    {"totalTests", total},
    {"maxElapsedMs", res.max_elapsed_ms},
    {"maxMemoryKb", res.max_memory_kb},
    {"results", std::move(results)},
  };
  if (res.verdict == Verdict::COMPILE_ERROR) ret["compileError"] = res.compile_error;
  return ret;
}

nlohmann::json LanguageToJson(const LanguageDescriptor& lang) {
  return {
    {"id", lang.id},
    {"name", lang.name},
    {"extension", lang.file_extension},
    {"compiled", lang.IsCompiled()},
    {"compileTimeoutMs", lang.compile_timeout_ms},
    {"timeMultiplier", lang.time_multiplier},
    {"memoryMultiplier", lang.memory_multiplier},
  };
}

nlohmann::json ErrorToJson(JudgeStatus status, const std::string& details) {
  switch (status) {
    case JudgeStatus::OK: return {{"error", ""}, {"details", details}};
    case JudgeStatus::VALIDATION_ERROR: return {{"error", "Validation failed"}, {"details", details}};
    case JudgeStatus::OVERLOADED:
      return {{"error", "Server overloaded"}, {"details", "Too many submissions in progress; retry later"}};
    case JudgeStatus::CANCELLED: return {{"error", "Submission cancelled"}, {"details", details}};
    case JudgeStatus::INTERNAL_ERROR:
      return {{"error", "Internal server error"}, {"details", "An unexpected error occurred"}};
  }
  __builtin_unreachable();
}

int HttpStatusCode(JudgeStatus status) {
  return JudgeStatusCode(status);
}
