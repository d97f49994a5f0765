#include "sandbox_exec.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codnite/submission.h>
#include "paths.h"
#include "file_utils.h"

namespace {

constexpr int kPollIntervalMs = 50;

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = (const char*)buf;
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    ptr += n, len -= n;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = (char*)buf;
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) {
      errno = EPIPE; // helper exited without a result
      return false;
    }
    ptr += n, len -= n;
  }
  return true;
}

// wait until the result is readable; return false if cancelled or failed
bool WaitReadable(int fd, const CancelToken* token, bool& cancelled) {
  cancelled = false;
  while (true) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int r = poll(&pfd, 1, kPollIntervalMs);
    if (r < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (r > 0) return true;
    if (token && token->IsCancelled()) {
      cancelled = true;
      return false;
    }
  }
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt, const CancelToken* token) {
  struct cjail_result ret = {};
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  bool cancelled = false;
  pid_t pid;
  // prepared before fork since the child must not allocate
  const fs::path cmd = SandboxExecPath();
  const auto vec = opt.Serialize();
  const long size = vec.size();
  // pipes of concurrent submissions must not leak into each other's helper
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err_pipe;
  pid = fork();
  if (pid < 0) goto err_pipe;
  if (pid == 0) {
    // own process group so that cancellation can kill everything it spawns
    setpgid(0, 0);
    // the judge ignores SIGPIPE; sandboxed programs get the default
    signal(SIGPIPE, SIG_DFL);
    if (dup2(inpipe[1], 1) < 0 || dup2(outpipe[0], 0) < 0) _exit(1);
    CloseFrom(3);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  // also set it here to avoid racing with kill()
  setpgid(pid, pid);
  spdlog::debug("cjail_exec pid={} childpid={} boxdir={} command={}",
      getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
  close(inpipe[1]);
  close(outpipe[0]);
  inpipe[1] = outpipe[0] = -1;
  if (!WriteAll(outpipe[1], &size, sizeof(size)) ||
      !WriteAll(outpipe[1], vec.data(), vec.size()) ||
      !WaitReadable(inpipe[0], token, cancelled) ||
      !ReadAll(inpipe[0], &ret, sizeof(ret))) {
    int err = cancelled ? ECANCELED : errno;
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    close(inpipe[0]);
    close(outpipe[1]);
    if (cancelled) {
      spdlog::info("Sandbox cancelled: boxdir={}", opt.boxdir);
    } else {
      spdlog::warn("SandboxExec error: errno={} {}", err, strerror(err));
    }
    ret = {};
    ret.oomkill = err;
    ret.timekill = -1;
    return ret;
  }
  close(inpipe[0]);
  close(outpipe[1]);
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;

err_pipe:
  {
    int err = errno;
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
      if (fd >= 0) close(fd);
    }
    spdlog::warn("SandboxExec error: errno={} {}", err, strerror(err));
    ret.oomkill = err;
    ret.timekill = -1;
    return ret;
  }
}
