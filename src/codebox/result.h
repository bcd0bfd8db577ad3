#ifndef CODEBOX_RESULT_H_
#define CODEBOX_RESULT_H_

#include <codebox/sandbox.h>
#include <nlohmann/json_fwd.hpp>

nlohmann::json ExecutionResultToJson(const ExecutionResult&);
// throws nlohmann::json::exception if the fields have the wrong types
CodeRequest CodeRequestFromJson(const nlohmann::json&);

#endif  // CODEBOX_RESULT_H_
