#include <evobox/sandbox.h>

#include <spdlog/spdlog.h>
#include "utils.h"

TestCase::TestCase(nlohmann::json args_, nlohmann::json kwargs_) :
    args(std::move(args_)), kwargs(std::move(kwargs_)) {
  if (!args.is_array()) throw ConfigurationError("Test case args must be an array");
  if (!kwargs.is_object()) throw ConfigurationError("Test case kwargs must be an object");
}

nlohmann::json TestCase::ToJson() const {
  return {{"args", args}, {"kwargs", kwargs}};
}

// Accepted forms of each element:
//   {"args": [...], "kwargs": {...}} (either key may be omitted)
//   [...] positional arguments only
std::vector<TestCase> ParseTestCases(const nlohmann::json& data) {
  using nlohmann::json;
  if (!data.is_array()) throw ConfigurationError("Test cases must be a JSON array");
  std::vector<TestCase> ret;
  for (size_t i = 0; i < data.size(); i++) {
    const json& item = data[i];
    if (item.is_array()) {
      ret.emplace_back(item, json::object());
    } else if (item.is_object()) {
      ret.emplace_back(item.value("args", json::array()), item.value("kwargs", json::object()));
    } else {
      throw ConfigurationError("Test case " + std::to_string(i) + " is neither an array nor an object");
    }
  }
  return ret;
}

std::vector<TestCase> LoadTestCases(const fs::path& path) {
  std::string content = ReadFile(path);
  if (content.empty()) throw ConfigurationError("Cannot read test cases from " + path.string());
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(content);
  } catch (nlohmann::json::exception& err) {
    throw ConfigurationError("Test cases file " + path.string() + " is not valid JSON: " + err.what());
  }
  auto ret = ParseTestCases(data);
  spdlog::info("Loaded {} test cases from {}", ret.size(), path.c_str());
  return ret;
}

void LoadEvalResult(const fs::path& artifact, EvalResult& res) {
  using nlohmann::json;
  std::string content = ReadFile(artifact);
  if (content.empty()) {
    res.status = ResultStatus::UNAVAILABLE;
    res.message = ResultStatusDesc(res.status);
    return;
  }
  json data;
  try {
    data = json::parse(content);
  } catch (json::exception& err) {
    spdlog::warn("Output artifact {} cannot be parsed: {}", res.output_path.c_str(), err.what());
    res.status = ResultStatus::CORRUPT;
    res.message = err.what();
    return;
  }
  if (!data.is_object() || !data.contains("output") || !data.contains("exit_code") ||
      !data["exit_code"].is_number_integer()) {
    spdlog::warn("Output artifact {} lacks the output or exit code", res.output_path.c_str());
    res.status = ResultStatus::CORRUPT;
    res.message = ResultStatusDesc(res.status);
    return;
  }
  res.status = ResultStatus::OK;
  res.output = std::move(data["output"]);
  res.exit_code = data["exit_code"].get<int>();
  auto error = data.find("error");
  if (error != data.end() && error->is_string()) res.message = error->get<std::string>();
}
