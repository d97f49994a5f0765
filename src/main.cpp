#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codnite/paths.h>
#include <codnite/validator.h>
#include <codnite/submission.h>
#include <codnite/worker_pool.h>
#include "server.h"

namespace {

bool to_lock = true;

// matches the uid pool of the runner; more workers could never get a uid
constexpr int kMaxWorkers = 100;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_submission_queue_size"] | kMaxQueue;
  kQueueWaitMs = ini[""]["queue_wait_ms"] | kQueueWaitMs;
  kMaxRSS = (ini[""]["max_rss_per_task_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = ini[""]["max_output_per_task_kb"] | kMaxOutput;
  kTimeMultiplier = ini[""]["time_multiplier"] | kTimeMultiplier;
  kMinTimeLimitMs = ini[""]["min_time_limit_ms"] | kMinTimeLimitMs;
  kMaxTimeLimitMs = ini[""]["max_time_limit_ms"] | kMaxTimeLimitMs;
  kMinMemoryLimitMb = ini[""]["min_memory_limit_mb"] | kMinMemoryLimitMb;
  kMaxMemoryLimitMb = ini[""]["max_memory_limit_mb"] | kMaxMemoryLimitMb;
  kMaxCodeBytes = (ini[""]["max_code_kb"] | (kMaxCodeBytes / 1024)) * 1024;
  kMaxTestCases = ini[""]["max_test_cases"] | kMaxTestCases;
  kMaxTestCaseBytes = (ini[""]["max_test_case_kb"] | (kMaxTestCaseBytes / 1024)) * 1024;
  kFailFast = ini[""]["fail_fast"] | kFailFast;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codnite-judge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/codnite-judge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel submissions (0 = derive from host)");
  parser.add_argument("-m", "--time-multiplier")
    .scan<'g', double>()
    .help("Ratio of real time to indicated time");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port of the HTTP listener");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<double>("--time-multiplier")) {
    kTimeMultiplier = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kListenPort = val.value();
  }
  to_lock = parser["--no-lock"] == false;

  if (kMaxParallel <= 0) kMaxParallel = HostWorkerCapacity(MaxRunMemoryKb(kMaxMemoryLimitMb));
  kMaxParallel = std::min(kMaxParallel, kMaxWorkers);
  if (kTimeMultiplier <= 0) {
    spdlog::error("Invalid time multiplier {}", kTimeMultiplier);
    exit(1);
  }
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  // a helper that dies early must surface as EPIPE, not kill the judge
  signal(SIGPIPE, SIG_IGN);
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another judge instance is running.");
    return 1;
  }
  return ServerWorkLoop() ? 0 : 1;
}
