#ifndef INCLUDE_CODNITE_VALIDATOR_H_
#define INCLUDE_CODNITE_VALIDATOR_H_

#include <string>
#include <variant>

#include "language.h"
#include "submission.h"

// administrative bounds
extern long kMaxCodeBytes;
extern long kMaxTestCaseBytes; // for input and expected output separately
extern long kMaxTestCases;
extern long kMinTimeLimitMs;
extern long kMaxTimeLimitMs;
extern long kMinMemoryLimitMb;
extern long kMaxMemoryLimitMb;

#define ENUM_VALIDATION_FAILURE_ \
  X(MALFORMED_REQUEST, "Malformed request") \
  X(EMPTY_CODE, "Code cannot be empty") \
  X(CODE_TOO_LARGE, "Code exceeds the maximum size") \
  X(UNSUPPORTED_LANGUAGE, "Unsupported language") \
  X(NO_TEST_CASES, "At least one test case is required") \
  X(TOO_MANY_TEST_CASES, "Too many test cases") \
  X(TEST_CASE_TOO_LARGE, "Test case exceeds the maximum size") \
  X(TIME_LIMIT_OUT_OF_RANGE, "Time limit out of range") \
  X(MEMORY_LIMIT_OUT_OF_RANGE, "Memory limit out of range")
enum class ValidationFailure {
#define X(name, desc) name,
  ENUM_VALIDATION_FAILURE_
#undef X
};

struct ValidationError {
  ValidationFailure failure;
  std::string details;
};

class ValidatedRequest;
std::variant<ValidatedRequest, ValidationError> Validate(JudgeRequest&&);

// Can only be created by Validate; owns the request for the duration of one judge run.
class ValidatedRequest {
  JudgeRequest request_;
  const LanguageDescriptor* language_;

  ValidatedRequest(JudgeRequest&& request, const LanguageDescriptor* language) :
      request_(std::move(request)), language_(language) {}
  friend std::variant<ValidatedRequest, ValidationError> Validate(JudgeRequest&&);
 public:
  ValidatedRequest(ValidatedRequest&&) = default;
  ValidatedRequest(const ValidatedRequest&) = delete;
  ValidatedRequest& operator=(const ValidatedRequest&) = delete;

  const JudgeRequest& Request() const { return request_; }
  const LanguageDescriptor& Language() const { return *language_; }
};

#endif  // INCLUDE_CODNITE_VALIDATOR_H_
