#include "sandbox.h"

#include <cstring>
#include <filesystem>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto ReadInt = [&]() {
    Int r = 0;
    if (cur + sizeof(Int) <= vec.size()) memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0 || cur + size > vec.size()) size = 0;
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  boxdir = ReadString();
  command.resize(ReadInt());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadInt());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  input = ReadString();
  output = ReadString();
  error = ReadString();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  dirs.resize(ReadInt());
  for (auto& i : dirs) i = ReadString();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto AddLenWrite = [&](size_t len, Int r){
    Int cur = ret.size();
    ret.resize(cur + len);
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushInt = [&](Int r) { AddLenWrite(sizeof(Int), r); };
  auto PushString = [&](const std::string& str){
    Int cur = ret.size();
    AddLenWrite(str.size() + sizeof(Int), str.size());
    memcpy(ret.data() + (cur + sizeof(Int)), str.c_str(), str.size());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushString(input);
  PushString(output);
  PushString(error);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> existing;
  for (auto& i : dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(i, ec)) existing.push_back(std::move(i));
  }
  dirs = std::move(existing);
}

CJailCtxClass::CJailCtxClass(const SandboxOptions& opt) : mnt_list_(mnt_list_new()) {
  struct cjail_ctx& ctx = ctx_;
  cjail_ctx_init(&ctx);
  ctx.sharenet = 0; // no network inside the box
  if (!opt.input.empty()) ctx.redir_input = const_cast<char*>(opt.input.data());
  if (!opt.output.empty()) ctx.redir_output = const_cast<char*>(opt.output.data());
  if (!opt.error.empty()) ctx.redir_error = const_cast<char*>(opt.error.data());
  for (auto& i : opt.command) argv_buf_.push_back(i.data());
  argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(argv_buf_.data());
  for (auto& i : opt.envs) env_buf_.emplace_back(i.data());
  env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(env_buf_.data());
  ctx.chroot = const_cast<char*>(opt.boxdir.data());
  ctx.working_dir = const_cast<char*>(opt.workdir.data());
  ctx.cpuset = nullptr;
  ctx.uid = opt.uid;
  ctx.gid = opt.gid;
  ctx.rlim_as = opt.vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = opt.file_num;
  ctx.rlim_fsize = opt.fsize;
  ctx.rlim_proc = opt.proc_num;
  ctx.cg_rss = opt.rss;
  ctx.lim_time.tv_sec = opt.wall_time / 1'000'000;
  ctx.lim_time.tv_usec = opt.wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = opt.cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = opt.cpu_time % 1'000'000;
  // pointers into str_buf_ and mnt_buf_ are kept, so they must not reallocate
  str_buf_.reserve(opt.dirs.size());
  mnt_buf_.reserve(opt.dirs.size());
  for (auto& i : opt.dirs) {
    mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = mnt_buf_.back();
    str_buf_.push_back("bind");
    mnt_ctx.type = str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = mnt_list_;
}
