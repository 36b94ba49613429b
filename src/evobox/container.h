#ifndef EVOBOX_CONTAINER_H_
#define EVOBOX_CONTAINER_H_

#include <string>
#include <vector>

#include <evobox/sandbox.h>

// Wrappers over the engine's command line. Failing steps are logged and recorded as
//   ProvisioningWarning on the runtime; the return value tells whether the step succeeded.

ProcessResult RunStep(SandboxRuntime&, const std::string& step,
                      const std::vector<std::string>& argv, const ProcessOptions& = ProcessOptions());

bool ContainerExists(SandboxRuntime&);
bool RemoveContainer(SandboxRuntime&);
// throws BuildError
void BuildImage(SandboxRuntime&, const SandboxOptions&);
bool CreateContainer(SandboxRuntime&, const SandboxOptions&);
bool InstallDriver(SandboxRuntime&);
bool StartContainer(SandboxRuntime&);

#endif  // EVOBOX_CONTAINER_H_
