#ifndef INCLUDE_CODNITE_COMPARE_H_
#define INCLUDE_CODNITE_COMPARE_H_

#include <string>
#include <string_view>

#include "verdict.h"

// Comparison settings of one test case.
//   LINE: trailing whitespaces of every line and trailing blank lines are ignored
//   STRICT: byte-exact after line endings are normalized
//   WHITESPACE: lines compared word by word
//   FLOAT: as WHITESPACE, but words of the expected output that look like
//     floating point numbers match within tolerance (absolute-relative)
// CRLF and CR are always treated as LF.
struct CompareOptions {
  CompareMode mode;
  long double tolerance;

  CompareOptions() : mode(CompareMode::LINE), tolerance(1e-6) {}
  CompareOptions(CompareMode mode, long double tolerance = 1e-6) :
      mode(mode), tolerance(tolerance) {}
};

// message (if not null) receives a short description of the first difference
bool OutputMatches(std::string_view actual, std::string_view expected,
                   const CompareOptions& = CompareOptions(), std::string* message = nullptr);

// PASSED or WRONG_ANSWER
Verdict Compare(std::string_view actual, std::string_view expected,
                const CompareOptions& = CompareOptions(), std::string* message = nullptr);

#endif  // INCLUDE_CODNITE_COMPARE_H_
