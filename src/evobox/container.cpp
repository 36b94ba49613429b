#include "container.h"

#include <sstream>

#include <spdlog/spdlog.h>
#include <evobox/paths.h>
#include "utils.h"

std::string kSandboxImageName = "evobox-sandbox";
std::string kSandboxContainerName = "evobox-sandbox";
std::string kPythonVersion = "3.11.6";

BuildError::BuildError(const std::string& image, const ProcessResult& result) :
    SandboxError("Failed to build the container image " + image + " (" + DescribeResult(result) +
                 "). Please check the Dockerfile and the build context."),
    image(image), result(result) {}

ProcessResult RunStep(SandboxRuntime& rt, const std::string& step,
                      const std::vector<std::string>& argv, const ProcessOptions& opt) {
  spdlog::debug("{}: {}", step, FormatCommand(argv));
  ProcessResult res = rt.Runner()->Run(argv, opt);
  if (!res.Success()) {
    spdlog::warn("Step '{}' failed: {}", step, DescribeResult(res));
    rt.AddWarning({step, argv, res});
  }
  return res;
}

bool ContainerExists(SandboxRuntime& rt) {
  std::vector<std::string> argv = {
    rt.Executable(), "ps", "-a",
    "--filter", "name=^" + kSandboxContainerName + "$",
    "--format", "{{.Names}}",
  };
  spdlog::debug("Checking container: {}", FormatCommand(argv));
  ProcessResult res = rt.Runner()->Run(argv, ProcessOptions());
  if (!res.Success()) {
    spdlog::info("Cannot list containers ({}), assuming none", DescribeResult(res));
    return false;
  }
  std::istringstream ss(res.out);
  for (std::string line; std::getline(ss, line);) {
    if (line == kSandboxContainerName) return true;
  }
  return false;
}

bool RemoveContainer(SandboxRuntime& rt) {
  if (!ContainerExists(rt)) {
    spdlog::debug("No container to remove.");
    return true;
  }
  return RunStep(rt, "remove", {rt.Executable(), "rm", "-f", kSandboxContainerName}).Success();
}

void BuildImage(SandboxRuntime& rt, const SandboxOptions& opt) {
  spdlog::info("Building container image {} (python {})", kSandboxImageName, kPythonVersion);
  std::vector<std::string> argv = {
    rt.Executable(), "build",
    "--build-arg", "PYTHON_VERSION=" + kPythonVersion,
    "--build-arg", "PROJECT_ROOT=.",
    "--build-arg", "EVAL_RELPATH=" + opt.eval_relpath.string(),
  };
  if (!opt.setup_relpath.empty()) {
    argv.insert(argv.end(), {"--build-arg", "SETUP_RELPATH=" + opt.setup_relpath.string()});
  }
  // the build context is the project root
  argv.insert(argv.end(), {"-t", kSandboxImageName, "-f", DockerfilePath().string(),
                           opt.project_root.string()});
  spdlog::debug("build: {}", FormatCommand(argv));
  ProcessResult res = rt.Runner()->Run(argv, ProcessOptions());
  if (!res.Success()) {
    spdlog::error("Failed to build image {}: {}", kSandboxImageName, DescribeResult(res));
    throw BuildError(kSandboxImageName, res);
  }
}

bool CreateContainer(SandboxRuntime& rt, const SandboxOptions& opt) {
  spdlog::info("Creating container {} from the built image", kSandboxContainerName);
  std::string mount = "type=bind,source=" + fs::absolute(opt.imps_root).string() +
                      ",target=" + kContainerImpsPath + ",readonly";
  return RunStep(rt, "create", {
    rt.Executable(), "create", "-i",
    "--name", kSandboxContainerName,
    "--mount", mount,
    kSandboxImageName + ":latest",
  }).Success();
}

bool InstallDriver(SandboxRuntime& rt) {
  return RunStep(rt, "install driver", {
    rt.Executable(), "cp", DriverScriptPath().string(),
    kSandboxContainerName + ":" + kContainerMainPath,
  }).Success();
}

// starting a running container is a no-op
bool StartContainer(SandboxRuntime& rt) {
  return RunStep(rt, "start", {rt.Executable(), "start", kSandboxContainerName}).Success();
}
