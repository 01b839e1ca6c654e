#ifndef CODEJUDGE_SANDBOX_H_
#define CODEJUDGE_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>
#include <nlohmann/json_fwd.hpp>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  std::vector<std::string> dirs; // bind-mounted read-only views of the host

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  explicit SandboxOptions(const nlohmann::json&);

  // drop bind mounts whose source does not exist on this host
  void FilterDirs();
  nlohmann::json ToJson() const;
  // ctx is filled in place; it points into this object and ctx, so neither may be modified afterwards
  void ToCJailCtx(CJailCtxClass& ctx) const;
};

#endif  // CODEJUDGE_SANDBOX_H_
