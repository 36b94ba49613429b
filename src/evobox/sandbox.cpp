#include <evobox/sandbox.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <evobox/paths.h>
#include "container.h"
#include "utils.h"

double kWatchdogGrace = 10.0;

namespace {

// all checks happen before any command is issued
void ValidateOptions(const SandboxOptions& opt) {
  std::error_code ec;
  if (!fs::is_directory(opt.project_root, ec)) {
    throw ConfigurationError(fmt::format(
        "Project root {} is not a directory", opt.project_root.string()));
  }
  if (!fs::is_directory(opt.imps_root, ec)) {
    throw ConfigurationError(fmt::format(
        "Implementations root {} is not a directory", opt.imps_root.string()));
  }
  fs::path eval_abspath = opt.project_root / opt.eval_relpath;
  if (opt.eval_relpath.empty() || !fs::exists(eval_abspath, ec)) {
    throw ConfigurationError(fmt::format(
        "Evaluation file {} does not exist in the project root {}",
        opt.eval_relpath.string(), opt.project_root.string()));
  }
  if (!fs::is_regular_file(eval_abspath, ec) || eval_abspath.extension() != ".py") {
    throw ConfigurationError(fmt::format(
        "Evaluation file must be a Python file, got {}", eval_abspath.string()));
  }
  if (!opt.setup_relpath.empty()) {
    fs::path setup_abspath = opt.project_root / opt.setup_relpath;
    if (!fs::is_regular_file(setup_abspath, ec) || setup_abspath.extension() != ".sh") {
      throw ConfigurationError(fmt::format(
          "Setup file must be an existing shell script, got {}", setup_abspath.string()));
    }
  }
  if (opt.interpreter.empty()) throw ConfigurationError("Interpreter path is empty");
}

// the driver parses it as a float
std::string FormatTimeout(double timeout) {
  return fmt::format("{:.3f}", timeout > 0 ? timeout : 0.0);
}

} // namespace

SandboxOptions::SandboxOptions() :
    interpreter(kContainerInterpreter),
    force_rebuild(false) {}

bool SandboxOptions::SameProvisioning(const SandboxOptions& x) const {
  return project_root == x.project_root && imps_root == x.imps_root &&
         eval_relpath == x.eval_relpath && setup_relpath == x.setup_relpath;
}

Sandbox::Sandbox(const SandboxOptions& opt) : opt_(opt), id_(-1) {
  ValidateOptions(opt_);
  SandboxRuntime& rt = SandboxRuntime::Get();
  // a second sandbox waits here until the first one has provisioned the container
  std::lock_guard lck(rt.provision_mtx_);
  id_ = rt.Register(opt_);
  spdlog::debug("Sandbox registered: id={}", id_);
  if (id_ != 0) {
    auto first = rt.FirstOptions();
    if (first && !first->SameProvisioning(opt_)) {
      spdlog::warn("Sandbox {} requests different provisioning parameters than sandbox 0 "
                   "(project_root={} eval={} setup={}); they are ignored",
                   id_, opt_.project_root.string(), opt_.eval_relpath.string(),
                   opt_.setup_relpath.string());
    }
    if (opt_.force_rebuild) {
      spdlog::warn("Sandbox {} requests a rebuild; only the first sandbox provisions", id_);
    }
    return;
  }
  try {
    Provision(rt);
  } catch (...) {
    // let a retry become the first sandbox again
    rt.Unregister(id_);
    rt.SetState(ProvisionState::UNPROVISIONED);
    throw;
  }
}

void Sandbox::Provision(SandboxRuntime& rt) {
  rt.SelectEngine();
  if (opt_.force_rebuild || !ContainerExists(rt)) {
    rt.SetState(ProvisionState::UNPROVISIONED);
    RemoveContainer(rt);
    rt.SetState(ProvisionState::IMAGE_BUILDING);
    BuildImage(rt, opt_);
    rt.SetState(ProvisionState::IMAGE_BUILT);
    if (CreateContainer(rt, opt_)) {
      rt.SetState(ProvisionState::CONTAINER_CREATED);
      InstallDriver(rt);
    }
  } else {
    spdlog::info("Reusing existing container {}", kSandboxContainerName);
    rt.SetState(ProvisionState::CONTAINER_CREATED);
  }
  if (StartContainer(rt)) rt.SetState(ProvisionState::CONTAINER_RUNNING);
}

void Sandbox::UploadTestCases(const std::vector<TestCase>& test_cases) {
  SandboxRuntime& rt = SandboxRuntime::Get();
  std::lock_guard lck(rt.exec_mtx_);
  // removed when leaving this function, whether or not the copy succeeded
  TempPath staging = TempPath::Directory("evobox_inputs_");
  try {
    if (!staging.Valid()) throw UploadError("Cannot create a staging directory");
    for (size_t i = 0; i < test_cases.size(); i++) {
      fs::path file = staging.Path() / InputFileName(i);
      if (!WriteFile(file, test_cases[i].ToJson().dump())) {
        throw UploadError("Cannot write test case file " + file.string());
      }
    }
    std::vector<std::string> argv = {
      rt.Executable(), "cp", (staging.Path() / ".").string(),
      kSandboxContainerName + ":" + kContainerInputsPath,
    };
    spdlog::debug("Copying test cases to container: {}", FormatCommand(argv));
    ProcessResult res = rt.Runner()->Run(argv, ProcessOptions());
    if (!res.Success()) throw UploadError("Copying test cases failed: " + DescribeResult(res));
    spdlog::info("Uploaded {} test cases", test_cases.size());
  } catch (const std::exception& err) {
    spdlog::error("Failed to upload test cases: {}", err.what());
    throw;
  }
}

ExecuteResult Sandbox::Execute(const std::string& implementation_id, int test_id, double timeout) {
  std::lock_guard lck(SandboxRuntime::Get().exec_mtx_);
  return ExecuteLocked(implementation_id, test_id, timeout);
}

ExecuteResult Sandbox::ExecuteLocked(const std::string& implementation_id, int test_id, double timeout) {
  if (!IsValidImplementationId(implementation_id)) {
    throw ConfigurationError("Invalid implementation id '" + implementation_id + "'");
  }
  if (test_id < 0) throw ConfigurationError(fmt::format("Invalid test id {}", test_id));
  SandboxRuntime& rt = SandboxRuntime::Get();
  std::string exe = rt.Executable();

  ExecuteResult ret;
  fs::path input_path = ContainerInputPath(test_id);
  ret.output_path = ContainerOutputPath(implementation_id, test_id);
  ret.log_dir = ContainerLogDir(implementation_id, test_id);

  RunStep(rt, "mkdir", {
    exe, "exec", kSandboxContainerName, "mkdir", "-p",
    ret.log_dir.string(), ret.output_path.parent_path().string(),
  });
  // ids repeat across launches of a reused container; a run that writes nothing must not
  //   pick up the artifact of an earlier one
  RunStep(rt, "clear output", {
    exe, "exec", kSandboxContainerName, "rm", "-f", ret.output_path.string(),
  });

  // the id is restricted to shell-safe characters and every path is derived from constants
  std::string script = fmt::format(
      "{}={} {} {} {} {} {} {} > {} 2> {}",
      kHotswapEnvVar, implementation_id,
      opt_.interpreter, kContainerMainPath,
      kContainerEvalPath, input_path.string(), ret.output_path.string(),
      FormatTimeout(timeout),
      ContainerStdoutPath(implementation_id, test_id).string(),
      ContainerStderrPath(implementation_id, test_id).string());
  std::vector<std::string> argv = {exe, "exec", kSandboxContainerName, "/bin/bash", "-c", script};
  // the driver enforces the timeout; the watchdog only guards against a stuck exec
  ProcessOptions popt(timeout > 0 ? timeout + kWatchdogGrace : 0);
  spdlog::debug("Executing: {}", FormatCommand(argv));
  ProcessResult res = rt.Runner()->Run(argv, popt);
  ret.exit_code = res.exit_code;
  ret.timed_out = res.timed_out;
  if (res.timed_out) {
    spdlog::warn("Execution of {} on test {} did not finish within {}s; the container may need "
                 "to be restarted", implementation_id, test_id, popt.timeout);
  } else if (res.spawn_failed) {
    spdlog::warn("Execution of {} on test {} could not be started: {}",
                 implementation_id, test_id, res.err);
  } else {
    spdlog::debug("Execution of {} on test {}: {}", implementation_id, test_id, DescribeResult(res));
  }
  return ret;
}

EvalResult Sandbox::Run(const std::string& implementation_id, int test_id, double timeout) {
  SandboxRuntime& rt = SandboxRuntime::Get();
  std::lock_guard lck(rt.exec_mtx_);
  ExecuteResult exec = ExecuteLocked(implementation_id, test_id, timeout);

  EvalResult ret;
  ret.exec_exit_code = exec.exit_code;
  ret.timed_out = exec.timed_out;
  ret.output_path = exec.output_path;
  ret.log_dir = exec.log_dir;

  TempPath output_file = TempPath::File("evobox_output_", ".json");
  if (!output_file.Valid()) {
    ret.status = ResultStatus::UNAVAILABLE;
    ret.message = "Cannot create a temporary file for the output";
    return ret;
  }
  std::vector<std::string> argv = {
    rt.Executable(), "cp",
    kSandboxContainerName + ":" + exec.output_path.string(),
    output_file.Path().string(),
  };
  spdlog::debug("Copying output file from container: {}", FormatCommand(argv));
  ProcessResult res = rt.Runner()->Run(argv, ProcessOptions());
  if (!res.Success()) {
    spdlog::info("Copying output of {} on test {} failed: {}",
                 implementation_id, test_id, DescribeResult(res));
  }
  LoadEvalResult(output_file.Path(), ret);
  spdlog::info("Result of {} on test {}: {} exit_code={}", implementation_id, test_id,
               ResultStatusName(ret.status), ret.exit_code);
  return ret;
}
