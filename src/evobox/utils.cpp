#include "utils.h"

#include <fcntl.h>
#include <cerrno>
#include <unistd.h>
#include <cstring>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

static const char* kContainerEngineNameTable[] = {
#define X(name, exe) exe,
  ENUM_CONTAINER_ENGINE_
#undef X
};

const char* ContainerEngineName(ContainerEngine engine) {
  return kContainerEngineNameTable[(int)engine];
}

std::optional<ContainerEngine> GetContainerEngine(const std::string& str) {
  for (size_t i = 0; i < sizeof(kContainerEngineNameTable) / sizeof(kContainerEngineNameTable[0]); i++) {
    if (str == kContainerEngineNameTable[i]) return (ContainerEngine)i;
  }
  return std::nullopt;
}

static const char* kDispatchPolicyNameTable[] = {
#define X(name, str) str,
  ENUM_DISPATCH_POLICY_
#undef X
};

const char* DispatchPolicyName(DispatchPolicy policy) {
  return kDispatchPolicyNameTable[(int)policy];
}

std::optional<DispatchPolicy> GetDispatchPolicy(const std::string& str) {
  for (size_t i = 0; i < sizeof(kDispatchPolicyNameTable) / sizeof(kDispatchPolicyNameTable[0]); i++) {
    if (str == kDispatchPolicyNameTable[i]) return (DispatchPolicy)i;
  }
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(ResultStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultStatusDesc, ResultStatus, ENUM_RESULT_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(ResultStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultStatusName, ResultStatus, ENUM_RESULT_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(ProvisionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ProvisionStateName, ProvisionState, ENUM_PROVISION_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) {
    spdlog::warn("Failed opening {} for writing", path.c_str());
    return false;
  }
  fout << content;
  fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return "";
  std::ostringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

TempPath& TempPath::operator=(TempPath&& x) {
  if (this != &x) {
    if (Valid()) RemoveAll(path_);
    path_ = std::move(x.path_);
    x.path_.clear();
  }
  return *this;
}

TempPath::~TempPath() {
  if (Valid()) RemoveAll(path_);
}

TempPath TempPath::Directory(const std::string& prefix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) base = "/tmp";
  std::string tmpl = (base / (prefix + "XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating temporary directory {}: {}", tmpl, strerror(errno));
    return TempPath();
  }
  return TempPath(fs::path(tmpl));
}

TempPath TempPath::File(const std::string& prefix, const std::string& suffix) {
  std::error_code ec;
  fs::path base = fs::temp_directory_path(ec);
  if (ec) base = "/tmp";
  std::string tmpl = (base / (prefix + "XXXXXX" + suffix)).string();
  int fd = mkstemps(tmpl.data(), suffix.size());
  if (fd < 0) {
    spdlog::warn("Failed creating temporary file {}: {}", tmpl, strerror(errno));
    return TempPath();
  }
  close(fd);
  return TempPath(fs::path(tmpl));
}
