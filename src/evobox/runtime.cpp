#include <evobox/sandbox.h>

#include <spdlog/spdlog.h>
#include "utils.h"

SandboxRuntime::SandboxRuntime() :
    runner_(std::make_shared<SubprocessRunner>()),
    state_(ProvisionState::UNPROVISIONED),
    next_id_(0) {}

SandboxRuntime& SandboxRuntime::Get() {
  static SandboxRuntime runtime;
  return runtime;
}

void SandboxRuntime::SetRunner(std::shared_ptr<CommandRunner> runner) {
  std::lock_guard lck(mtx_);
  if (!runner) runner = std::make_shared<SubprocessRunner>();
  runner_ = std::move(runner);
}

std::shared_ptr<CommandRunner> SandboxRuntime::Runner() const {
  std::lock_guard lck(mtx_);
  return runner_;
}

bool SandboxRuntime::HasEngine(ContainerEngine engine) {
  ProcessResult res = Runner()->Run({ContainerEngineName(engine), "--version"}, ProcessOptions(30));
  spdlog::debug("Probe {}: {}", ContainerEngineName(engine), DescribeResult(res));
  return res.Success();
}

ContainerEngine SandboxRuntime::SelectEngine() {
  std::lock_guard lck(engine_mtx_);
  if (auto engine = Engine()) return *engine;
  for (ContainerEngine engine : {ContainerEngine::DOCKER, ContainerEngine::PODMAN}) {
    if (HasEngine(engine)) {
      UseEngine(engine);
      return engine;
    }
  }
  throw EnvironmentError("Could not find Podman or Docker: no supported container engine. "
                         "Cannot create sandbox.");
}

void SandboxRuntime::UseEngine(ContainerEngine engine) {
  spdlog::info("Using container engine: {}", ContainerEngineName(engine));
  std::lock_guard lck(mtx_);
  engine_ = engine;
}

std::optional<ContainerEngine> SandboxRuntime::Engine() const {
  std::lock_guard lck(mtx_);
  return engine_;
}

std::string SandboxRuntime::Executable() {
  return ContainerEngineName(SelectEngine());
}

ProvisionState SandboxRuntime::State() const {
  std::lock_guard lck(mtx_);
  return state_;
}

int SandboxRuntime::NumSandboxes() const {
  std::lock_guard lck(mtx_);
  return next_id_;
}

std::vector<ProvisioningWarning> SandboxRuntime::Warnings() const {
  std::lock_guard lck(mtx_);
  return warnings_;
}

void SandboxRuntime::AddWarning(ProvisioningWarning&& warning) {
  std::lock_guard lck(mtx_);
  warnings_.push_back(std::move(warning));
}

void SandboxRuntime::Teardown() {
  std::scoped_lock lck(engine_mtx_, mtx_);
  spdlog::debug("Sandbox runtime teardown");
  engine_.reset();
  state_ = ProvisionState::UNPROVISIONED;
  next_id_ = 0;
  first_options_.reset();
  warnings_.clear();
}

int SandboxRuntime::Register(const SandboxOptions& opt) {
  std::lock_guard lck(mtx_);
  int id = next_id_++;
  if (id == 0) first_options_ = opt;
  return id;
}

// only the latest registration can be rolled back
void SandboxRuntime::Unregister(int id) {
  std::lock_guard lck(mtx_);
  if (id != next_id_ - 1) return;
  next_id_--;
  if (id == 0) first_options_.reset();
}

void SandboxRuntime::SetState(ProvisionState state) {
  std::lock_guard lck(mtx_);
  spdlog::debug("Provision state {} -> {}", ProvisionStateName(state_), ProvisionStateName(state));
  state_ = state;
}

std::optional<SandboxOptions> SandboxRuntime::FirstOptions() const {
  std::lock_guard lck(mtx_);
  return first_options_;
}
