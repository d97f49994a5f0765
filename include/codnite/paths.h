#ifndef INCLUDE_CODNITE_PATHS_H_
#define INCLUDE_CODNITE_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// scratch directory of one submission; removed after judging
fs::path SubmissionRunPath(long id);
fs::path SandboxExecPath();
fs::path LockFilePath();

#endif  // INCLUDE_CODNITE_PATHS_H_
