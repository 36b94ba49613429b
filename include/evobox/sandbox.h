#ifndef INCLUDE_EVOBOX_SANDBOX_H_
#define INCLUDE_EVOBOX_SANDBOX_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <evobox/process.h>

namespace fs = std::filesystem;

extern std::string kSandboxImageName;
extern std::string kSandboxContainerName;
// interpreter version of the image, passed as a build argument
extern std::string kPythonVersion;
// seconds allowed on top of the in-container timeout before the host kills the exec
extern double kWatchdogGrace;

#define ENUM_CONTAINER_ENGINE_ \
  X(DOCKER, "docker") \
  X(PODMAN, "podman")
enum class ContainerEngine {
#define X(name, exe) name,
  ENUM_CONTAINER_ENGINE_
#undef X
};

#define ENUM_PROVISION_STATE_ \
  X(UNPROVISIONED) \
  X(IMAGE_BUILDING) \
  X(IMAGE_BUILT) \
  X(CONTAINER_CREATED) \
  X(CONTAINER_RUNNING)
enum class ProvisionState {
#define X(name) name,
  ENUM_PROVISION_STATE_
#undef X
};

#define ENUM_RESULT_STATUS_ \
  X(OK, "Result available") \
  X(UNAVAILABLE, "No output artifact was produced") \
  X(CORRUPT, "Output artifact is malformed")
enum class ResultStatus {
#define X(name, desc) name,
  ENUM_RESULT_STATUS_
#undef X
};

class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
// bad or missing paths at sandbox construction
class ConfigurationError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};
// no container engine on this host
class EnvironmentError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};
class BuildError : public SandboxError {
 public:
  std::string image;
  ProcessResult result;
  BuildError(const std::string& image, const ProcessResult& result);
};
class UploadError : public SandboxError {
 public:
  using SandboxError::SandboxError;
};

class TestCase {
 public:
  const nlohmann::json args;   // array
  const nlohmann::json kwargs; // object

  TestCase() : args(nlohmann::json::array()), kwargs(nlohmann::json::object()) {}
  TestCase(nlohmann::json args_, nlohmann::json kwargs_);

  nlohmann::json ToJson() const;
};

// throws ConfigurationError
std::vector<TestCase> ParseTestCases(const nlohmann::json&);
std::vector<TestCase> LoadTestCases(const fs::path&);

class SandboxOptions {
 public:
  fs::path project_root;
  fs::path imps_root;
  fs::path eval_relpath;  // relative to project_root
  fs::path setup_relpath; // relative to project_root; empty for none
  std::string interpreter; // inside the container
  bool force_rebuild;

  SandboxOptions();
  // whether the provisioning parameters are the same
  bool SameProvisioning(const SandboxOptions&) const;
};

struct ExecuteResult {
  fs::path output_path; // inside the container
  fs::path log_dir;     // inside the container
  int exit_code;
  bool timed_out;

  ExecuteResult() : exit_code(-1), timed_out(false) {}
};

struct EvalResult {
  ResultStatus status;
  nlohmann::json output;
  int exit_code;      // recorded by the driver inside the container
  int exec_exit_code; // of the exec invocation
  bool timed_out;     // host watchdog fired
  fs::path output_path, log_dir;
  std::string message;

  EvalResult() : status(ResultStatus::UNAVAILABLE), exit_code(-1), exec_exit_code(-1), timed_out(false) {}
};

// fills status/output/exit_code/message from a copied output artifact
void LoadEvalResult(const fs::path& artifact, EvalResult&);

struct ProvisioningWarning {
  std::string step;
  std::vector<std::string> command;
  ProcessResult result;
};

class Sandbox;

// Process-wide state shared by all sandboxes: the selected engine, the provisioning
//   state of the single container, and the counter of sandbox instances.
class SandboxRuntime {
 public:
  static SandboxRuntime& Get();

  // nullptr restores the default SubprocessRunner
  void SetRunner(std::shared_ptr<CommandRunner>);
  std::shared_ptr<CommandRunner> Runner() const;

  bool HasEngine(ContainerEngine);
  // probes docker, then podman; cached after the first success
  ContainerEngine SelectEngine();
  void UseEngine(ContainerEngine);
  std::optional<ContainerEngine> Engine() const;
  std::string Executable();

  ProvisionState State() const;
  int NumSandboxes() const;
  std::vector<ProvisioningWarning> Warnings() const;
  void AddWarning(ProvisioningWarning&&);

  // Back to the initial state: no engine, unprovisioned, no sandboxes.
  // The runner is kept. Only for test isolation; the container itself is left alone.
  void Teardown();

  SandboxRuntime(const SandboxRuntime&) = delete;
  SandboxRuntime& operator=(const SandboxRuntime&) = delete;

 private:
  friend class Sandbox;
  SandboxRuntime();

  int Register(const SandboxOptions&);
  void Unregister(int id);
  void SetState(ProvisionState);
  std::optional<SandboxOptions> FirstOptions() const;

  mutable std::mutex mtx_;
  std::mutex engine_mtx_;    // held while probing
  std::mutex provision_mtx_; // held while registering & provisioning
  std::mutex exec_mtx_;      // the container does not support concurrent executions

  std::shared_ptr<CommandRunner> runner_;
  std::optional<ContainerEngine> engine_;
  ProvisionState state_;
  int next_id_;
  std::optional<SandboxOptions> first_options_;
  std::vector<ProvisioningWarning> warnings_;
};

// A handle to the shared execution container. Only the first instance in a process
//   builds/creates/starts the container; the others reuse it.
class Sandbox {
 public:
  // throws ConfigurationError, EnvironmentError, BuildError
  explicit Sandbox(const SandboxOptions&);

  int Id() const { return id_; }
  const SandboxOptions& Options() const { return opt_; }

  // test case i is stored as InputFileName(i); throws UploadError
  void UploadTestCases(const std::vector<TestCase>&);
  // timeout in seconds, enforced by the driver; 0 for no limit
  ExecuteResult Execute(const std::string& implementation_id, int test_id, double timeout = 30.0);
  EvalResult Run(const std::string& implementation_id, int test_id, double timeout = 30.0);

 private:
  void Provision(SandboxRuntime&);
  ExecuteResult ExecuteLocked(const std::string& implementation_id, int test_id, double timeout);

  SandboxOptions opt_;
  int id_;
};

#endif  // INCLUDE_EVOBOX_SANDBOX_H_
