#ifndef INCLUDE_EVOBOX_PATHS_H_
#define INCLUDE_EVOBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// host side, shipped in the data directory
fs::path DockerfilePath();
fs::path DriverScriptPath();

// container filesystem layout
extern const char kContainerMainPath[];
extern const char kContainerEvalPath[];
extern const char kContainerLogsPath[];
extern const char kContainerInputsPath[];
extern const char kContainerOutputsPath[];
extern const char kContainerImpsPath[];
extern const char kContainerWorkspacePath[];
extern const char kContainerInterpreter[];
// carries the implementation id to the driver for hot-swapping
extern const char kHotswapEnvVar[];

// Implementation ids are restricted to [A-Za-z0-9_.-] (and not "." or "..")
//   so that paths derived from different ids never alias.
bool IsValidImplementationId(const std::string&);

std::string InputFileName(int test_id);
fs::path ContainerInputPath(int test_id);
fs::path ContainerOutputPath(const std::string& implementation_id, int test_id);
fs::path ContainerLogDir(const std::string& implementation_id, int test_id);
fs::path ContainerStdoutPath(const std::string& implementation_id, int test_id);
fs::path ContainerStderrPath(const std::string& implementation_id, int test_id);

fs::path ImplementationPath(const fs::path& imps_root, const std::string& implementation_id);

#endif  // INCLUDE_EVOBOX_PATHS_H_
