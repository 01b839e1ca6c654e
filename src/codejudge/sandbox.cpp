#include "sandbox.h"

#include <unistd.h>
#include <filesystem>

#include <nlohmann/json.hpp>

SandboxOptions::SandboxOptions(const nlohmann::json& j) : SandboxOptions() {
  boxdir = j.at("boxdir").get<std::string>();
  command = j.at("command").get<std::vector<std::string>>();
  envs = j.value("envs", std::vector<std::string>());
  workdir = j.value("workdir", std::string());
  input = j.value("input", std::string());
  output = j.value("output", std::string());
  error = j.value("error", std::string());
  cpu_set = j.value("cpu_set", std::vector<int>());
  uid = j.value("uid", uid);
  gid = j.value("gid", gid);
  wall_time = j.value("wall_time", wall_time);
  cpu_time = j.value("cpu_time", cpu_time);
  rss = j.value("rss", rss);
  vss = j.value("vss", vss);
  proc_num = j.value("proc_num", proc_num);
  file_num = j.value("file_num", file_num);
  fsize = j.value("fsize", fsize);
  dirs = j.value("dirs", std::vector<std::string>());
}

nlohmann::json SandboxOptions::ToJson() const {
  return {
    {"boxdir", boxdir},
    {"command", command},
    {"envs", envs},
    {"workdir", workdir},
    {"input", input},
    {"output", output},
    {"error", error},
    {"cpu_set", cpu_set},
    {"uid", uid},
    {"gid", gid},
    {"wall_time", wall_time},
    {"cpu_time", cpu_time},
    {"rss", rss},
    {"vss", vss},
    {"proc_num", proc_num},
    {"file_num", file_num},
    {"fsize", fsize},
    {"dirs", dirs},
  };
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> kept;
  for (auto& i : dirs) {
    std::error_code ec;
    if (std::filesystem::exists(i, ec)) kept.push_back(i);
  }
  dirs.swap(kept);
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  // default: cgroup_root
  if (cpu_set.empty()) {
    ctx.cpuset = nullptr;
  } else {
    CPU_ZERO(&ret.cpu_set_);
    for (auto& i : cpu_set) CPU_SET(i, &ret.cpu_set_);
    ctx.cpuset = &ret.cpu_set_;
  }
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // bind mounts; str_buf_ must not reallocate after taking data()
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.resize(dirs.size());
  for (size_t i = 0; i < dirs.size(); i++) {
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_[i];
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = dirs[i].data();
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
