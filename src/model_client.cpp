#include "model_client.h"

#include <fstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "http_utils.h"

namespace {

constexpr std::chrono::milliseconds kRetryInterval(1000);
const char kSchemaName[] = "program_implementation";

} // namespace

OpenAIModel::OpenAIModel(const ModelOptions& opt) : opt_(opt), prompt_count_(0) {
  auto url = http_utils::SplitUrl(opt_.url);
  if (!url) throw ModelError("Invalid model URL '" + opt_.url + "'");
  host_ = url->first;
  endpoint_ = url->second + "/chat/completions";
  if (opt_.samples_per_prompt < 1) throw ModelError("samples_per_prompt must be positive");
  if (!opt_.log_path.empty()) {
    std::error_code ec;
    fs::create_directories(opt_.log_path, ec);
    if (ec) spdlog::warn("Cannot create model log directory {}: {}", opt_.log_path.c_str(), ec.message());
  }
  spdlog::info("Model {} at {}{} ({} samples per prompt{})", opt_.model, host_, endpoint_,
               opt_.samples_per_prompt, opt_.native_n ? "" : ", one request each");
}

nlohmann::json OpenAIModel::RequestBody(const std::string& prompt, int n) const {
  using nlohmann::json;
  json messages = json::array();
  if (opt_.system_prompt.size()) {
    messages.push_back({{"role", "system"}, {"content", opt_.system_prompt}});
  }
  messages.push_back({{"role", "user"}, {"content", prompt}});
  json body{{"model", opt_.model}, {"messages", std::move(messages)}, {"n", n}};
  if (!opt_.output_schema.is_null()) {
    body["response_format"] = {
      {"type", "json_schema"},
      {"json_schema", {{"name", kSchemaName}, {"schema", opt_.output_schema}, {"strict", true}}},
    };
  }
  return body;
}

std::vector<std::string> OpenAIModel::Complete(const std::string& prompt, int n) {
  using nlohmann::json;
  httplib::Client cli(host_);
  if (!cli.is_valid()) throw ModelError("Cannot create an HTTP client for " + host_);
  if (opt_.api_key.size()) cli.set_bearer_token_auth(opt_.api_key.c_str());
  long timeout_us = static_cast<long>(opt_.timeout * 1000000);
  cli.set_read_timeout(timeout_us / 1000000, timeout_us % 1000000);
  cli.set_write_timeout(timeout_us / 1000000, timeout_us % 1000000);

  std::string body = RequestBody(prompt, n).dump();
  auto res = RequestRetry<HTTPPost>(opt_.retries, kRetryInterval, cli, endpoint_,
                                    body, "application/json");
  if (!IsSuccess(res)) {
    if (!res) throw ModelError(fmt::format("Model request failed: error code {}", (int)res.error()));
    throw ModelError(fmt::format("Model request failed with status {}: {}",
                                 res->status, http_utils::FormatOneParam(res->body)));
  }

  std::vector<std::string> ret;
  try {
    json data = json::parse(res->body);
    for (auto& choice : data.at("choices")) {
      const json& content = choice.at("message").at("content");
      if (!content.is_string()) {
        spdlog::warn("Model returned a choice without content");
        continue;
      }
      ret.push_back(content.get<std::string>());
    }
  } catch (json::exception& err) {
    throw ModelError(fmt::format("Malformed model response: {}", err.what()));
  }
  for (auto& i : ret) Log(prompt, i);
  return ret;
}

std::vector<std::string> OpenAIModel::DrawSamples(const std::string& prompt) {
  if (opt_.native_n) return Complete(prompt, opt_.samples_per_prompt);
  std::vector<std::string> ret;
  for (int i = 0; i < opt_.samples_per_prompt; i++) {
    for (auto& sample : Complete(prompt, 1)) ret.push_back(std::move(sample));
  }
  return ret;
}

long OpenAIModel::PromptCount() const {
  std::lock_guard lck(log_mtx_);
  return prompt_count_;
}

void OpenAIModel::Log(const std::string& prompt, const std::string& response) {
  std::lock_guard lck(log_mtx_);
  long index = ++prompt_count_;
  if (opt_.log_path.empty()) return;
  std::ofstream(opt_.log_path / fmt::format("prompt_{}.log", index), std::ios::app) << prompt;
  std::ofstream(opt_.log_path / fmt::format("response_{}.log", index), std::ios::app) << response;
}
