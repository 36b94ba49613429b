#include "utils.h"

#include <cstdlib>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace {

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

ProcessResult Exited(int code, const std::string& out = "", const std::string& err = "") {
  ProcessResult ret;
  ret.exit_code = code;
  ret.out = out;
  ret.err = err;
  return ret;
}

} // namespace

ProcessResult FakeRunner::Run(const std::vector<std::string>& argv, const ProcessOptions& opt) {
  Handler h;
  {
    std::lock_guard lck(mtx_);
    calls_.push_back({argv, opt});
    h = handler;
  }
  if (h) {
    if (auto res = h(argv)) return *res;
  }
  return Default(argv);
}

ProcessResult FakeRunner::Default(const std::vector<std::string>& argv) {
  std::lock_guard lck(mtx_);
  if (argv.size() < 2) return Exited(1);
  if (argv[1] == "--version") {
    if (!engines.count(argv[0])) {
      ProcessResult ret;
      ret.spawn_failed = true;
      ret.err = argv[0] + ": No such file or directory";
      return ret;
    }
    return Exited(0, argv[0] + " version 0.0.0\n");
  }
  if (auto it = failures_.find(argv[1]); it != failures_.end()) {
    return Exited(it->second.first, "", it->second.second);
  }
  if (argv[1] == "ps") {
    return Exited(0, container_exists ? kSandboxContainerName + "\n" : "");
  }
  if (argv[1] == "create") container_exists = true;
  if (argv[1] == "rm") container_exists = false;
  if (argv[1] == "exec" && argv.size() >= 5 && argv[3] == "rm") {
    for (size_t i = 4; i < argv.size(); i++) container_files_.erase(argv[i]);
  }
  if (argv[1] == "exec" && argv.size() == 6 && argv[3] == "/bin/bash") {
    // the driver writes the output path given on its command line
    for (auto& [path, content] : artifacts_) {
      if (argv[5].find(" " + path + " ") != std::string::npos) container_files_[path] = content;
    }
  }
  if (argv[1] == "cp" && argv.size() == 4) {
    const std::string prefix = kSandboxContainerName + ":";
    if (argv[2].rfind(prefix, 0) == 0) {
      // container -> host
      auto it = container_files_.find(argv[2].substr(prefix.size()));
      if (it == container_files_.end()) return Exited(1, "", "Could not find the file " + argv[2]);
      std::ofstream(argv[3]) << it->second;
    } else if (argv[3] == prefix + kContainerInputsPath) {
      // host staging directory -> container
      staging_dir_ = fs::path(argv[2]).parent_path();
      uploaded_.clear();
      for (auto& entry : fs::directory_iterator(staging_dir_)) {
        uploaded_[entry.path().filename().string()] = ReadAll(entry.path());
      }
    }
  }
  return Exited(0);
}

std::vector<FakeRunner::Call> FakeRunner::Calls() const {
  std::lock_guard lck(mtx_);
  return calls_;
}

std::vector<std::vector<std::string>> FakeRunner::CallsOf(const std::string& subcommand) const {
  std::lock_guard lck(mtx_);
  std::vector<std::vector<std::string>> ret;
  for (auto& i : calls_) {
    if (i.argv.size() >= 2 && i.argv[1] == subcommand) ret.push_back(i.argv);
  }
  return ret;
}

void FakeRunner::ClearCalls() {
  std::lock_guard lck(mtx_);
  calls_.clear();
}

void FakeRunner::Fail(const std::string& subcommand, int exit_code, const std::string& err) {
  std::lock_guard lck(mtx_);
  if (exit_code == 0) {
    failures_.erase(subcommand);
  } else {
    failures_[subcommand] = {exit_code, err};
  }
}

void FakeRunner::SetArtifact(const std::string& container_path, const std::string& content) {
  std::lock_guard lck(mtx_);
  artifacts_[container_path] = content;
}

void FakeRunner::ClearArtifacts() {
  std::lock_guard lck(mtx_);
  artifacts_.clear();
}

void FakeRunner::SetContainerFile(const std::string& container_path, const std::string& content) {
  std::lock_guard lck(mtx_);
  container_files_[container_path] = content;
}

std::map<std::string, std::string> FakeRunner::Uploaded() const {
  std::lock_guard lck(mtx_);
  return uploaded_;
}

fs::path FakeRunner::LastStagingDir() const {
  std::lock_guard lck(mtx_);
  return staging_dir_;
}

fs::path MakeTempDir(const std::string& prefix) {
  std::string tmpl = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) return fs::path();
  return tmpl;
}

LogCapture::LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(ss_)) {
  sink_->set_pattern("%l %v");
  spdlog::default_logger()->sinks().push_back(sink_);
}

LogCapture::~LogCapture() {
  auto& sinks = spdlog::default_logger()->sinks();
  sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
}

std::string LogCapture::Text() const {
  sink_->flush();
  return ss_.str();
}

void SandboxFixture::SetUp() {
  project_root_ = MakeTempDir("evobox_project_");
  imps_root_ = MakeTempDir("evobox_imps_");
  ASSERT_FALSE(project_root_.empty());
  ASSERT_FALSE(imps_root_.empty());
  std::ofstream(project_root_ / "eval.py") << "def main(*args, **kwargs):\n    return len(args)\n";
  std::ofstream(project_root_ / "setup.sh") << "#!/bin/bash\npip install numpy\n";
  std::ofstream(project_root_ / "notes.txt") << "not an entry point\n";
  runner_ = std::make_shared<FakeRunner>();
  SandboxRuntime::Get().Teardown();
  SandboxRuntime::Get().SetRunner(runner_);
}

void SandboxFixture::TearDown() {
  SandboxRuntime::Get().Teardown();
  SandboxRuntime::Get().SetRunner(nullptr);
  std::error_code ec;
  fs::remove_all(project_root_, ec);
  fs::remove_all(imps_root_, ec);
}

SandboxOptions SandboxFixture::Options() const {
  SandboxOptions opt;
  opt.project_root = project_root_;
  opt.imps_root = imps_root_;
  opt.eval_relpath = "eval.py";
  return opt;
}

std::shared_ptr<Sandbox> SandboxFixture::ProvisionedSandbox() {
  auto ret = std::make_shared<Sandbox>(Options());
  runner_->ClearCalls();
  return ret;
}
