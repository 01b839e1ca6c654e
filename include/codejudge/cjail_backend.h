#ifndef INCLUDE_CODEJUDGE_CJAIL_BACKEND_H_
#define INCLUDE_CODEJUDGE_CJAIL_BACKEND_H_

#include <mutex>
#include <chrono>
#include <condition_variable>
#include <string>
#include <vector>
#include <filesystem>

#include "backend.h"

struct CJailOptions {
  std::filesystem::path box_root;
  std::string python; // absolute path on the host; bind-mounted into the box
  std::vector<int> pinned_cpus; // empty = no pinning
  int uid_base, uid_pool_size;
  InvocationOptions invocation;

  CJailOptions() :
      box_root("/tmp/codejudge_box"),
      python("/usr/bin/python3"),
      uid_base(50000),
      uid_pool_size(100) {}
};

// Chroot + cgroup jail through libcjail. cjail is not known to be thread-safe,
// so every call runs it in a separate sandbox-exec helper process.
class CJailBackend : public IsolationBackend {
  CJailOptions opt_;
  std::mutex pool_mtx_;
  std::condition_variable pool_cv_;
  std::vector<int> uid_pool_, cpu_pool_;

  // waits at most `wait` for a free uid and cpu_count pinned CPUs
  bool Acquire(int& uid, std::vector<int>& cpus, int cpu_count, std::chrono::milliseconds wait);
  void Release(int uid, const std::vector<int>& cpus);
 public:
  explicit CJailBackend(CJailOptions opt);

  const char* Name() const override { return "cjail"; }
  bool Probe(std::string& reason) const override;
  RawExecutionResult Run(const std::string& code, const nlohmann::json& input,
                         const ExecutionLimits& limits, ExecutionMonitor& monitor) override;

  const CJailOptions& options() const { return opt_; }
};

#endif  // INCLUDE_CODEJUDGE_CJAIL_BACKEND_H_
