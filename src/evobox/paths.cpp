#include <evobox/paths.h>

#include <algorithm>

namespace internal {
fs::path kDataDir = fs::path(EVOBOX_DATA_DIR);
} // internal

const char kContainerMainPath[] = "/home/main.py";
const char kContainerEvalPath[] = "/home/eval.py";
const char kContainerLogsPath[] = "/home/logs";
const char kContainerInputsPath[] = "/home/inputs";
const char kContainerOutputsPath[] = "/home/outputs";
const char kContainerImpsPath[] = "/home/imps";
const char kContainerWorkspacePath[] = "/home/workspace";
const char kContainerInterpreter[] = "/usr/local/bin/python";
const char kHotswapEnvVar[] = "EVOBOX_HOTSWAP_ID";

fs::path DockerfilePath() {
  return internal::kDataDir / "container" / "Dockerfile";
}
fs::path DriverScriptPath() {
  return internal::kDataDir / "container" / "main.py";
}

bool IsValidImplementationId(const std::string& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-';
  });
}

std::string InputFileName(int test_id) {
  return std::to_string(test_id) + ".json";
}
fs::path ContainerInputPath(int test_id) {
  return fs::path(kContainerInputsPath) / InputFileName(test_id);
}
fs::path ContainerOutputPath(const std::string& implementation_id, int test_id) {
  return fs::path(kContainerOutputsPath) / implementation_id /
      ("output_" + std::to_string(test_id) + ".json");
}
fs::path ContainerLogDir(const std::string& implementation_id, int test_id) {
  return fs::path(kContainerLogsPath) / implementation_id / ("test_" + std::to_string(test_id));
}
fs::path ContainerStdoutPath(const std::string& implementation_id, int test_id) {
  return ContainerLogDir(implementation_id, test_id) / "stdout.txt";
}
fs::path ContainerStderrPath(const std::string& implementation_id, int test_id) {
  return ContainerLogDir(implementation_id, test_id) / "stderr.txt";
}

fs::path ImplementationPath(const fs::path& imps_root, const std::string& implementation_id) {
  return imps_root / implementation_id;
}
