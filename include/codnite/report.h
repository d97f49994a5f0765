#ifndef INCLUDE_CODNITE_REPORT_H_
#define INCLUDE_CODNITE_REPORT_H_

#include <string>
#include <nlohmann/json_fwd.hpp>

#include "verdict.h"
#include "language.h"
#include "submission.h"

// Inbound: body of POST /execute. Absent fields keep the defaults of JudgeRequest;
//   return false (with details) if a present field has the wrong type.
bool JudgeRequestFromJson(const nlohmann::json&, JudgeRequest&, std::string& details);

// Structured results handed back to collaborators (persistence, feed, notifications).
// The engine never calls them; they store or display these documents.

nlohmann::json TestVerdictToJson(const TestVerdict&);
nlohmann::json SubmissionResultToJson(const SubmissionResult&);
nlohmann::json LanguageToJson(const LanguageDescriptor&);
// {error, details}; never contains internal information for INTERNAL_ERROR
nlohmann::json ErrorToJson(JudgeStatus, const std::string& details);

int HttpStatusCode(JudgeStatus);

#endif  // INCLUDE_CODNITE_REPORT_H_
