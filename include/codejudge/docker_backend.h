#ifndef INCLUDE_CODEJUDGE_DOCKER_BACKEND_H_
#define INCLUDE_CODEJUDGE_DOCKER_BACKEND_H_

#include <string>

#include "backend.h"

struct DockerOptions {
  std::string binary; // resolved through PATH if not containing '/'
  std::string image;
  std::string python; // interpreter inside the image
  std::string socket; // daemon socket checked by Probe(); empty to skip (e.g. remote DOCKER_HOST)
  std::string network;
  int pids_limit; // 0 for no limit
  InvocationOptions invocation;

  DockerOptions() :
      binary("docker"),
      image("python:3.11-slim"),
      python("python"),
      socket("/var/run/docker.sock"),
      network("none"),
      pids_limit(64) {}
};

// One `docker run --rm` container per call
class DockerBackend : public IsolationBackend {
  DockerOptions opt_;
 public:
  explicit DockerBackend(DockerOptions opt) : opt_(std::move(opt)) {}

  const char* Name() const override { return "docker"; }
  bool Probe(std::string& reason) const override;
  RawExecutionResult Run(const std::string& code, const nlohmann::json& input,
                         const ExecutionLimits& limits, ExecutionMonitor& monitor) override;

  const DockerOptions& options() const { return opt_; }
};

#endif  // INCLUDE_CODEJUDGE_DOCKER_BACKEND_H_
