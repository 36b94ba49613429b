#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <sstream>
#include <filesystem>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include <evobox/paths.h>
#include <evobox/process.h>
#include <evobox/sandbox.h>

namespace fs = std::filesystem;

// Stands in for the container engine. Every command is recorded; by default all of them
//   succeed, and the container filesystem is emulated only as far as cp needs it.
class FakeRunner : public CommandRunner {
 public:
  struct Call {
    std::vector<std::string> argv;
    ProcessOptions opt;
  };
  // returning nullopt falls through to the default behavior
  using Handler = std::function<std::optional<ProcessResult>(const std::vector<std::string>&)>;

  std::set<std::string> engines = {"docker", "podman"};
  bool container_exists = false;
  Handler handler;

  ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions&) override;

  std::vector<Call> Calls() const;
  // commands whose subcommand (argv[1]) is the given one
  std::vector<std::vector<std::string>> CallsOf(const std::string& subcommand) const;
  size_t CountOf(const std::string& subcommand) const { return CallsOf(subcommand).size(); }
  void ClearCalls();

  // make "<engine> <subcommand> ..." exit with the code
  void Fail(const std::string& subcommand, int exit_code = 1, const std::string& err = "failed");
  // written to the container path by the driver whenever a run's script names that path
  void SetArtifact(const std::string& container_path, const std::string& content);
  void ClearArtifacts();
  // a file already present in the container; served by "cp <container>:<path> <host path>"
  //   and removed by "exec <container> rm"
  void SetContainerFile(const std::string& container_path, const std::string& content);

  // files found in the staging directory of the last upload, by name
  std::map<std::string, std::string> Uploaded() const;
  fs::path LastStagingDir() const;

 private:
  ProcessResult Default(const std::vector<std::string>& argv);

  mutable std::mutex mtx_;
  std::vector<Call> calls_;
  std::map<std::string, std::pair<int, std::string>> failures_;
  std::map<std::string, std::string> artifacts_;
  std::map<std::string, std::string> container_files_;
  std::map<std::string, std::string> uploaded_;
  fs::path staging_dir_;
};

fs::path MakeTempDir(const std::string& prefix);

// Copies everything the default logger emits while alive.
class LogCapture {
 public:
  LogCapture();
  ~LogCapture();
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::string Text() const;
  bool Contains(const std::string& str) const { return Text().find(str) != std::string::npos; }

 private:
  std::ostringstream ss_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

// A project root holding eval.py (and setup.sh) and an empty implementations root,
//   with the sandbox runtime reset and pointed to a FakeRunner.
class SandboxFixture : public ::testing::Test {
 protected:
  fs::path project_root_, imps_root_;
  std::shared_ptr<FakeRunner> runner_;

  void SetUp() override;
  void TearDown() override;

  SandboxOptions Options() const;
  // a sandbox that has already provisioned, with the recorded calls cleared
  std::shared_ptr<Sandbox> ProvisionedSandbox();
};

#endif // TEST_UTILS_H_
