#include "utils.h"

#include <unistd.h>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <codnite/service.h>
#include <codnite/language.h>
#include <codnite/validator.h>

namespace {

bool InPath(const std::string& tool) {
  const char* path = getenv("PATH");
  std::istringstream sin(path ? path : "/usr/bin:/bin");
  std::error_code ec;
  for (std::string dir; std::getline(sin, dir, ':');) {
    if (!dir.empty() && std::filesystem::exists(std::filesystem::path(dir) / tool, ec)) return true;
  }
  return false;
}

} // namespace

bool SandboxAvailable() {
  return geteuid() == 0 && SandboxHealthy();
}

bool ToolchainAvailable(const std::string& lang) {
  const LanguageDescriptor* desc = FindLanguage(lang);
  if (!desc) return false;
  for (auto* cmd : {&desc->compile_command, &desc->run_command}) {
    if (cmd->size() >= 2 && (*cmd)[0] == "/usr/bin/env" && !InPath((*cmd)[1])) return false;
  }
  return true;
}

JudgeRequest MakeRequest(
    const std::string& lang, const std::string& code,
    const std::vector<std::pair<std::string, std::string>>& tests,
    double time_limit_seconds, long memory_limit_mb) {
  JudgeRequest req;
  req.language_id = lang;
  req.code = code;
  for (auto& [input, output] : tests) {
    TestCase test;
    test.input = input;
    test.expected_output = output;
    req.test_cases.push_back(std::move(test));
  }
  req.time_limit_seconds = time_limit_seconds;
  req.memory_limit_mb = memory_limit_mb;
  return req;
}

SubmissionResult RunSubmission(JudgeRequest&& req, const CancelToken* token) {
  auto validated = Validate(std::move(req));
  if (auto* err = std::get_if<ValidationError>(&validated)) {
    ADD_FAILURE() << "Validation failed: " << err->details;
    return SubmissionResult();
  }
  return JudgeSubmission(std::get<ValidatedRequest>(validated), token);
}
