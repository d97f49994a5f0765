#include <errno.h>
#include <string>
#include <gtest/gtest.h>
#include <codnite/paths.h>
#include "sandbox_exec.h"

namespace {

class DataDirOverride {
  fs::path orig_;
 public:
  explicit DataDirOverride(const fs::path& dir) : orig_(internal::kDataDir) { internal::kDataDir = dir; }
  ~DataDirOverride() { internal::kDataDir = orig_; }
};

} // namespace

// The helper exits before reading its options; the write must fail with EPIPE
//   instead of killing the judge.
TEST(SandboxExecTest, HelperExitsBeforeReading) {
  DataDirOverride dir("/nonexistent-codnite-data-dir");
  SandboxOptions opt;
  opt.boxdir = "/nonexistent-box";
  // larger than a pipe buffer
  opt.command = {std::string(4 * 1024 * 1024, 'x')};
  struct cjail_result res = SandboxExec(opt);
  EXPECT_EQ(res.timekill, -1);
  EXPECT_EQ(res.oomkill, EPIPE);
}
