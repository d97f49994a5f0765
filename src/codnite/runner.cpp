#include "runner.h"

#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <regex>
#include <vector>
#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "file_utils.h"
#include "sandbox_exec.h"

namespace {

const std::vector<std::string> kExecuteDirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
const std::vector<std::string> kCompileDirs = {"/usr", "/var/lib", "/lib", "/lib64", "/etc/alternatives", "/bin"};

// grace added to the time limit before the sandbox kills the program
constexpr long kWallGraceMs = 200;
constexpr long kCpuGraceMs = 50;

inline long ToMs(const struct timeval& v) {
  return ((long)v.tv_sec * 1'000'000 + v.tv_usec) * (long double)kTimeMultiplier / 1000;
}

std::vector<std::string> SandboxDirs(const std::vector<std::string>& base, const LanguageDescriptor& lang) {
  std::vector<std::string> ret = base;
  ret.insert(ret.end(), lang.extra_dirs.begin(), lang.extra_dirs.end());
  return ret;
}

std::vector<std::string> SandboxEnvs() {
  std::vector<std::string> ret;
  if (char* path = getenv("PATH")) ret.push_back(std::string("PATH=") + path);
  return ret;
}

// files the run command needs: everything the compile step left in its workdir
//   except diagnostics (and the source, if it was compiled into something else)
std::vector<fs::path> CompiledArtifacts(long id, const LanguageDescriptor& lang, uintmax_t& total_size) {
  std::vector<fs::path> ret;
  total_size = 0;
  const fs::path skip[] = {
    CompileBoxOutput(id),
    CompileBoxError(id),
    lang.IsCompiled() && lang.source_name != lang.program_name ? CompileBoxSource(id, lang) : fs::path(),
  };
  std::error_code ec;
  for (auto it = fs::directory_iterator(Workdir(CompileBoxPath(id)), ec); !ec && it != fs::directory_iterator();
       it.increment(ec)) {
    if (!it->is_regular_file(ec) || ec) continue;
    if (std::find(std::begin(skip), std::end(skip), it->path()) != std::end(skip)) continue;
    total_size += (it->file_size(ec) / 4096 + 1) * 4096;
    ret.push_back(it->path());
  }
  if (ec) spdlog::warn("Failed listing compiled artifacts: id={} {}", id, ec.message());
  return ret;
}

std::string CompileMessage(long id, bool limit_exceeded) {
  static const std::regex kFilterRegex(
      "(^|\\n)In file included from[\\S\\s]*?(\\n/workdir/prog|$)");
  static const std::string kFilterReplace = "$1[Error messages from headers removed]$2";

  std::string message, stdout_message;
  bool truncated = false, stdout_truncated = false;
  IGNORE_RETURN(ReadFile(CompileBoxError(id), kMaxCompileMessage, message, &truncated));
  if (message.size() < kMaxCompileMessage) {
    IGNORE_RETURN(ReadFile(CompileBoxOutput(id), kMaxCompileMessage - message.size(),
                           stdout_message, &stdout_truncated));
    message += stdout_message;
  } else if (std::error_code ec; !fs::is_empty(CompileBoxOutput(id), ec) && !ec) {
    truncated = true;
  }
  truncated = truncated || stdout_truncated;
  message = std::regex_replace(message, kFilterRegex, kFilterReplace);
  if (truncated) {
    message += "\n[Error message truncated after " + std::to_string(kMaxCompileMessage) + " bytes]";
  }
  if (limit_exceeded) message = "Compilation time limit exceeded\n" + message;
  if (message.empty()) message = "Compilation failed";
  return message;
}

std::mutex uid_mtx;
std::vector<int> uid_pool;
bool uid_pool_init = false;

} // namespace

UidLease::UidLease() {
  std::lock_guard lck(uid_mtx);
  if (!uid_pool_init) {
    for (int i = kUidPoolSize - 1; i >= 0; i--) uid_pool.push_back(i + kUidBase);
    uid_pool_init = true;
  }
  if (uid_pool.empty()) throw std::runtime_error("No available sandbox uid");
  uid_ = uid_pool.back();
  uid_pool.pop_back();
}

UidLease::~UidLease() {
  std::lock_guard lck(uid_mtx);
  uid_pool.push_back(uid_);
}

SubmissionBox::SubmissionBox(long id) : id_(id) {
  // leftover of an earlier run with the same id
  if (fs::exists(SubmissionRunPath(id))) RemoveAll(SubmissionRunPath(id));
  if (!CreateDirs(SubmissionRunPath(id))) {
    throw std::runtime_error("Failed creating box " + SubmissionRunPath(id).string());
  }
}

SubmissionBox::~SubmissionBox() {
  RemoveAll(SubmissionRunPath(id_));
}

ExecutionLimits EffectiveLimits(const JudgeRequest& req, const LanguageDescriptor& lang) {
  ExecutionLimits ret;
  ret.time_ms = std::lround(req.time_limit_seconds * 1000 * lang.time_multiplier);
  ret.memory_kb = std::min((long)std::lround(req.memory_limit_mb * 1024 * lang.memory_multiplier), kMaxRSS);
  ret.output_kb = kMaxOutput;
  ret.proc_num = lang.process_limit;
  return ret;
}

long RunMemoryCeilingKb(const ExecutionLimits& lim) {
  // Output file is accounted in cgroups, so we need to extend RSS limit
  // MLE check is still done against the requested limit
  return std::min(lim.memory_kb + 1024, kMaxRSS) + lim.output_kb;
}

long MaxRunMemoryKb(long max_memory_limit_mb) {
  JudgeRequest req;
  req.memory_limit_mb = max_memory_limit_mb;
  long ret = 0;
  for (auto& lang : Languages()) ret = std::max(ret, RunMemoryCeilingKb(EffectiveLimits(req, lang)));
  return ret;
}

void ClassifyExecution(const struct cjail_result& res, const ExecutionLimits& lim, bool cancelled,
                       ExecutionOutcome& out) {
  out.elapsed_ms = ToMs(res.time);
  out.cpu_ms = ToMs(res.rus.ru_utime) + ToMs(res.rus.ru_stime);
  out.peak_memory_kb = res.rus.ru_maxrss;
  bool killed = res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED;
  if (killed) {
    out.signal = res.info.si_status;
    out.exit_code = 128 + out.signal;
  } else {
    out.signal = 0;
    out.exit_code = res.info.si_status;
  }
  if (cancelled) {
    out.reason = TerminationReason::CANCELLED;
  } else if (res.timekill == -1) {
    // timekill = -1 means SandboxExec error (see sandbox_exec.cpp, sandbox_main.cpp)
    out.reason = TerminationReason::SANDBOX_ERROR;
    out.message = "Execution error";
  } else if (res.oomkill > 0) {
    // oomkill = -1 means failed to read oom (see cjail/cjail.h)
    out.reason = TerminationReason::MEMORY_EXCEEDED;
  } else if (res.timekill) {
    out.reason = TerminationReason::TIMEOUT;
  } else if (killed) {
    if (out.signal == SIGXFSZ) {
      out.reason = TerminationReason::SIGNAL_KILLED;
      out.message = "Output limit exceeded";
    } else if (out.peak_memory_kb > lim.memory_kb) {
      // MLE will likely cause SIGSEGV or std::bad_alloc (SIGABRT), so we check it before SIG
      out.reason = TerminationReason::MEMORY_EXCEEDED;
    } else if (out.signal == SIGXCPU || out.cpu_ms > lim.time_ms) {
      // RLIMIT_CPU
      out.reason = TerminationReason::TIMEOUT;
    } else {
      out.reason = TerminationReason::SIGNAL_KILLED;
      out.message = fmt::format("Killed by signal {} ({})", out.signal, strsignal(out.signal));
    }
  } else if (out.peak_memory_kb > lim.memory_kb) {
    out.reason = TerminationReason::MEMORY_EXCEEDED;
  } else if (out.exit_code != 0) {
    out.reason = TerminationReason::RUNTIME_ERROR;
    out.message = fmt::format("Exited with code {}", out.exit_code);
  } else if (out.cpu_ms > lim.time_ms || out.elapsed_ms > lim.time_ms) {
    out.reason = TerminationReason::TIMEOUT;
  } else {
    out.reason = TerminationReason::NORMAL;
  }
}

CompileOutcome CompileSubmission(const ValidatedRequest& vreq, int uid, const CancelToken* token) {
  const JudgeRequest& req = vreq.Request();
  const LanguageDescriptor& lang = vreq.Language();
  long id = req.submission_internal_id;

  if (!CreateDirs(Workdir(CompileBoxPath(id)), fs::perms::all) ||
      !WriteFile(CompileBoxSource(id, lang), req.code, kPerm666)) {
    throw std::runtime_error("Failed setting up compile box");
  }
  if (!lang.IsCompiled()) return {true, false, ""};

  spdlog::debug("Generating compile settings: id={} lang={}", id, lang.id);
  SandboxOptions opt;
  opt.boxdir = CompileBoxPath(id);
  opt.command = ExpandCommand(lang.compile_command, {
    .source = CompileBoxSource(-1, lang, true),
    .program = CompileBoxProgram(-1, lang, true),
    .workdir = Workdir("/"),
  });
  opt.envs = SandboxEnvs();
  opt.workdir = Workdir("/");
  opt.output = CompileBoxOutput(-1, true);
  opt.error = CompileBoxError(-1, true);
  opt.uid = opt.gid = uid;
  opt.wall_time = lang.compile_timeout_ms * 1000;
  opt.wall_time /= kTimeMultiplier;
  opt.rss = kMaxRSS;
  opt.proc_num = std::max(10, lang.process_limit);
  opt.fsize = kMaxOutput;
  opt.dirs = SandboxDirs(kCompileDirs, lang);
  opt.FilterDirs();
  struct cjail_result res = SandboxExec(opt, token);

  if (token && token->IsCancelled()) return {false, true, ""};
  if (res.timekill == -1) {
    throw std::runtime_error(fmt::format("Sandbox error during compilation: {}", strerror(res.oomkill)));
  }
  bool limit_exceeded = res.timekill || res.oomkill > 0;
  if (!limit_exceeded && res.info.si_code == CLD_EXITED && res.info.si_status == 0 &&
      fs::is_regular_file(CompileBoxProgram(id, lang))) {
    spdlog::info("Compilation successful: id={}", id);
    return {true, false, ""};
  }
  spdlog::info("Compilation failed: id={} code={} status={} timekill={} oomkill={}",
               id, res.info.si_code, res.info.si_status, res.timekill, res.oomkill);
  std::string message = CompileMessage(id, limit_exceeded);
  spdlog::debug("Message: {}", message);
  return {false, false, std::move(message)};
}

ExecutionOutcome RunTestCase(const ValidatedRequest& vreq, int index, int uid, const CancelToken* token) {
  const JudgeRequest& req = vreq.Request();
  const LanguageDescriptor& lang = vreq.Language();
  const TestCase& test = req.test_cases.at(index);
  long id = req.submission_internal_id;
  ExecutionLimits lim = EffectiveLimits(req, lang);
  spdlog::debug("Generating execute settings: id={} test={}", id, index);

  ExecutionOutcome out;
  // the scratch box of this test case is torn down on every path
  struct ExecuteBoxGuard {
    fs::path box, workdir;
    bool mounted = false;
    ~ExecuteBoxGuard() {
      if (mounted) Umount(workdir);
      RemoveAll(box);
    }
  } guard{ExecuteBoxPath(id, index), Workdir(ExecuteBoxPath(id, index))};

  uintmax_t artifacts_size = 0;
  auto artifacts = CompiledArtifacts(id, lang, artifacts_size);
  long tmpfs_size_kib = artifacts_size / 1024 + (test.input.size() / 4096 + 1) * 4 + lim.output_kb * 2 + 64;
  bool setup = CreateDirs(guard.workdir) && (guard.mounted = MountTmpfs(guard.workdir, tmpfs_size_kib));
  if (setup) {
    std::error_code ec;
    fs::permissions(guard.workdir, fs::perms::all, ec);
    setup = !ec;
  }
  for (auto& i : artifacts) {
    if (!setup) break;
    setup = Copy(i, guard.workdir / i.filename(), fs::perms::all);
  }
  setup = setup && WriteFile(ExecuteBoxInput(id, index), test.input, kPerm666);
  if (!setup) {
    spdlog::error("Failed setting up execute box: id={} test={}", id, index);
    struct cjail_result res = {};
    res.timekill = -1;
    ClassifyExecution(res, lim, false, out);
    return out;
  }

  SandboxOptions opt;
  opt.boxdir = guard.box;
  opt.command = ExpandCommand(lang.run_command, {
    .source = ExecuteBoxProgram(-1, -1, lang, true),
    .program = ExecuteBoxProgram(-1, -1, lang, true),
    .workdir = Workdir("/"),
  });
  opt.envs = SandboxEnvs();
  opt.workdir = Workdir("/");
  opt.input = ExecuteBoxInput(-1, -1, true);
  opt.output = ExecuteBoxOutput(-1, -1, true);
  opt.error = ExecuteBoxError(-1, -1, true);
  opt.uid = opt.gid = uid;
  opt.wall_time = (lim.time_ms + kWallGraceMs) * 1000;
  opt.cpu_time = (lim.time_ms + kCpuGraceMs) * 1000;
  opt.wall_time /= kTimeMultiplier;
  opt.cpu_time /= kTimeMultiplier;
  if (opt.cpu_time <= 0) opt.cpu_time = 1; // avoid being regarded as no limit
  opt.rss = RunMemoryCeilingKb(lim);
  opt.proc_num = lim.proc_num;
  opt.fsize = lim.output_kb;
  opt.dirs = SandboxDirs(kExecuteDirs, lang);
  opt.FilterDirs();
  struct cjail_result res = SandboxExec(opt, token);

  ClassifyExecution(res, lim, token && token->IsCancelled(), out);
  IGNORE_RETURN(ReadFile(ExecuteBoxOutput(id, index), lim.output_kb * 1024, out.output));
  bool err_truncated = false;
  IGNORE_RETURN(ReadFile(ExecuteBoxError(id, index), kMaxReportedError, out.error_output, &err_truncated));
  if (err_truncated) out.error_output += "\n[truncated]";
  spdlog::info("Execute finished: id={} test={} code={} status={} reason={} time={} rss={}",
               id, index, res.info.si_code, res.info.si_status, TerminationReasonName(out.reason),
               out.elapsed_ms, out.peak_memory_kb);
  return out;
}
