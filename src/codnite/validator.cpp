#include <codnite/validator.h>

#include <cmath>
#include <fmt/format.h>
#include <codnite/utils.h>

long kMaxCodeBytes = 64 * 1024;
long kMaxTestCaseBytes = 16 * 1024 * 1024;
long kMaxTestCases = 100;
long kMinTimeLimitMs = 100;
long kMaxTimeLimitMs = 30'000;
long kMinMemoryLimitMb = 16;
long kMaxMemoryLimitMb = 1024;

namespace {

inline ValidationError Error(ValidationFailure failure, std::string details = "") {
  if (details.empty()) details = ValidationFailureDesc(failure);
  return {failure, std::move(details)};
}

} // namespace

std::variant<ValidatedRequest, ValidationError> Validate(JudgeRequest&& req) {
  if (req.code.empty() || req.code.find_first_not_of(" \t\r\n") == std::string::npos) {
    return Error(ValidationFailure::EMPTY_CODE);
  }
  if ((long)req.code.size() > kMaxCodeBytes) {
    return Error(ValidationFailure::CODE_TOO_LARGE,
        fmt::format("Code exceeds the maximum size of {} bytes", kMaxCodeBytes));
  }
  const LanguageDescriptor* lang = FindLanguage(req.language_id);
  if (!lang) {
    return Error(ValidationFailure::UNSUPPORTED_LANGUAGE,
        fmt::format("Unsupported language: {}", req.language_id));
  }
  if (req.test_cases.empty()) return Error(ValidationFailure::NO_TEST_CASES);
  if ((long)req.test_cases.size() > kMaxTestCases) {
    return Error(ValidationFailure::TOO_MANY_TEST_CASES,
        fmt::format("At most {} test cases are allowed", kMaxTestCases));
  }
  for (size_t i = 0; i < req.test_cases.size(); i++) {
    const auto& test = req.test_cases[i];
    if ((long)test.input.size() > kMaxTestCaseBytes || (long)test.expected_output.size() > kMaxTestCaseBytes) {
      return Error(ValidationFailure::TEST_CASE_TOO_LARGE,
          fmt::format("Test case {} exceeds the maximum size of {} bytes", i + 1, kMaxTestCaseBytes));
    }
    if (!std::isfinite((double)test.compare.tolerance) || test.compare.tolerance < 0) {
      return Error(ValidationFailure::MALFORMED_REQUEST,
          fmt::format("Test case {} has an invalid tolerance", i + 1));
    }
  }
  double time_limit_ms = req.time_limit_seconds * 1000;
  if (!std::isfinite(time_limit_ms) || time_limit_ms < kMinTimeLimitMs || time_limit_ms > kMaxTimeLimitMs) {
    return Error(ValidationFailure::TIME_LIMIT_OUT_OF_RANGE,
        fmt::format("Time limit must be between {} and {} seconds",
                    kMinTimeLimitMs / 1000.0, kMaxTimeLimitMs / 1000.0));
  }
  if (req.memory_limit_mb < kMinMemoryLimitMb || req.memory_limit_mb > kMaxMemoryLimitMb) {
    return Error(ValidationFailure::MEMORY_LIMIT_OUT_OF_RANGE,
        fmt::format("Memory limit must be between {} and {} MB", kMinMemoryLimitMb, kMaxMemoryLimitMb));
  }
  if (!req.submission_internal_id) req.submission_internal_id = GetUniqueSubmissionInternalId();
  return ValidatedRequest(std::move(req), lang);
}
