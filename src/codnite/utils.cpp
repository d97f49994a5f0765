#include "file_utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <atomic>
#include <algorithm>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long submission_internal_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueSubmissionInternalId() {
  return ++submission_internal_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG2(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToAbr, Verdict, ENUM_VERDICT_)
#undef X

#define X(...) X_RETURN_ARG2(TerminationReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TerminationReasonName, TerminationReason, ENUM_TERMINATION_REASON_)
#undef X

#define X(...) X_RETURN_ARG2(ValidationFailure, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ValidationFailureDesc, ValidationFailure, ENUM_VALIDATION_FAILURE_)
#undef X

#define X(...) X_RETURN_ARG1(ValidationFailure, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ValidationFailureName, ValidationFailure, ENUM_VALIDATION_FAILURE_)
#undef X

#define X(...) X_RETURN_ARG1(JudgeStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JudgeStatusName, JudgeStatus, ENUM_JUDGE_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(JudgeState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JudgeStateName, JudgeState, ENUM_JUDGE_STATE_)
#undef X

#define X(...) X_RETURN_ARG1(AcquireStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* AcquireStatusName, AcquireStatus, ENUM_ACQUIRE_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const int kJudgeStatusCodeTable[] = {
#define X(name, code) code,
  ENUM_JUDGE_STATUS_
#undef X
};

int JudgeStatusCode(JudgeStatus status) {
  return kJudgeStatusCodeTable[(int)status];
}

static const char* kCompareModeNameTable[] = {
#define X(name, desc) desc,
  ENUM_COMPARE_MODE_
#undef X
};

const char* CompareModeName(CompareMode mode) {
  return kCompareModeNameTable[(int)mode];
}

bool GetCompareMode(const std::string& str, CompareMode& mode) {
  for (size_t i = 0; i < sizeof(kCompareModeNameTable) / sizeof(kCompareModeNameTable[0]); i++) {
    if (str == kCompareModeNameTable[i]) {
      mode = (CompareMode)i;
      return true;
    }
  }
  return false;
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", 0,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  // MNT_DETACH: a killed sandbox may still hold the mount busy for a moment
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, size_t max_bytes, std::string& content, bool* truncated) {
  std::string().swap(content);
  if (truncated) *truncated = false;
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  // the buffer never grows beyond what the file actually holds
  std::error_code ec;
  uintmax_t file_size = fs::file_size(path, ec);
  if (!ec) content.reserve(std::min<uintmax_t>(file_size, max_bytes));
  char buf[65536];
  while (content.size() < max_bytes) {
    fin.read(buf, std::min(sizeof(buf), max_bytes - content.size()));
    content.append(buf, fin.gcount());
    if (!fin) break;
  }
  if (fin.bad()) return false;
  if (truncated && content.size() == max_bytes && fin.peek() != std::ifstream::traits_type::eof()) {
    *truncated = true;
  }
  return true;
}
