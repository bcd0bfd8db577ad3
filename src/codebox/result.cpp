#include "result.h"

#include <nlohmann/json.hpp>
#include <codebox/utils.h>

nlohmann::json ExecutionResultToJson(const ExecutionResult& res) {
  return {
    {"status", ExecutionStatusToAbr(res.status)},
    {"exit_code", res.exit_code},
    {"time_us", res.time_us},
    {"output", res.output},
    {"error", res.error},
    {"images", res.images},
  };
}

CodeRequest CodeRequestFromJson(const nlohmann::json& data) {
  CodeRequest ret;
  ret.code = data.at("code").get<std::string>();
  if (auto it = data.find("dependencies"); it != data.end() && !it->is_null()) {
    ret.dependencies = it->get<std::vector<std::string>>();
  }
  return ret;
}
