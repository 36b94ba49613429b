#ifndef INCLUDE_EVOBOX_UTILS_H_
#define INCLUDE_EVOBOX_UTILS_H_

#include <string>
#include <optional>

#include "sandbox.h"
#include "sampler.h"

const char* ContainerEngineName(ContainerEngine);
std::optional<ContainerEngine> GetContainerEngine(const std::string&);

const char* ResultStatusDesc(ResultStatus);
const char* DispatchPolicyName(DispatchPolicy);
std::optional<DispatchPolicy> GetDispatchPolicy(const std::string&);

// logging
const char* ResultStatusName(ResultStatus);
const char* ProvisionStateName(ProvisionState);

#endif  // INCLUDE_EVOBOX_UTILS_H_
