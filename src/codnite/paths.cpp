#include "paths.h"

fs::path kBoxRoot = "/tmp/codnite_box";

namespace internal {
fs::path kDataDir = fs::path(CODNITE_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SubmissionRunPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}

fs::path CompileBoxPath(long id) {
  return SubmissionRunPath(id) / "compile";
}
fs::path CompileBoxSource(long id, const LanguageDescriptor& lang, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / lang.source_name;
}
fs::path CompileBoxProgram(long id, const LanguageDescriptor& lang, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / lang.program_name;
}
fs::path CompileBoxOutput(long id, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / "compile.out";
}
fs::path CompileBoxError(long id, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / "compile.err";
}

fs::path ExecuteBoxPath(long id, int test) {
  return SubmissionRunPath(id) / ("execute" + PadInt(test, 3));
}
fs::path ExecuteBoxProgram(long id, int test, const LanguageDescriptor& lang, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, test), inside_box)) / lang.program_name;
}
fs::path ExecuteBoxInput(long id, int test, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, test), inside_box)) / "input";
}
fs::path ExecuteBoxOutput(long id, int test, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, test), inside_box)) / "output";
}
fs::path ExecuteBoxError(long id, int test, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, test), inside_box)) / "error";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}
fs::path LockFilePath() {
  return internal::kDataDir / "lock";
}
