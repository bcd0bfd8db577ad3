#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>

#include "sandbox.h"

const char* ExecutionStatusToDesc(ExecutionStatus);
const char* ExecutionStatusToAbr(ExecutionStatus);
ExecutionStatus AbrToExecutionStatus(const std::string&);

// logging
const char* SandboxStateName(SandboxState);

// random UUID (version 4)
std::string GenerateSandboxId();
// [A-Za-z0-9_-]{1,64}
bool IsValidSandboxId(const std::string&);

std::string Base64Encode(const std::string&);

#endif  // INCLUDE_CODEBOX_UTILS_H_
