#ifndef CODNITE_UTILS_H_
#define CODNITE_UTILS_H_

#include <string>

#include "verdict.h"
#include "validator.h"
#include "worker_pool.h"

long GetUniqueSubmissionInternalId();

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);

const char* TerminationReasonName(TerminationReason);
const char* CompareModeName(CompareMode);
// return false if not recognized
bool GetCompareMode(const std::string&, CompareMode&);

const char* ValidationFailureDesc(ValidationFailure);
const char* JudgeStatusName(JudgeStatus);
int JudgeStatusCode(JudgeStatus);

// logging
const char* JudgeStateName(JudgeState);
const char* AcquireStatusName(AcquireStatus);
const char* ValidationFailureName(ValidationFailure);

#endif  // CODNITE_UTILS_H_
