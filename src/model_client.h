#ifndef MODEL_CLIENT_H_
#define MODEL_CLIENT_H_

#include <mutex>
#include <string>
#include <vector>
#include <stdexcept>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <evobox/sampler.h>

namespace fs = std::filesystem;

class ModelError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct ModelOptions {
  std::string url; // base URL of an OpenAI-compatible API, e.g. https://host/v1
  std::string model;
  std::string api_key;
  std::string system_prompt; // empty for none
  int samples_per_prompt;
  bool native_n; // one request with n choices; otherwise one request per sample
  nlohmann::json output_schema; // null for free-form text
  fs::path log_path; // empty for no prompt/response logs
  int retries;
  double timeout; // seconds per request

  ModelOptions() : samples_per_prompt(1), native_n(true), retries(3), timeout(120) {}
};

// Draws samples from the chat completions endpoint.
class OpenAIModel : public ModelClient {
 public:
  // throws ModelError if the URL is not http(s)
  explicit OpenAIModel(const ModelOptions&);

  // throws ModelError
  std::vector<std::string> DrawSamples(const std::string& prompt) override;

  long PromptCount() const;

 private:
  nlohmann::json RequestBody(const std::string& prompt, int n) const;
  std::vector<std::string> Complete(const std::string& prompt, int n);
  void Log(const std::string& prompt, const std::string& response);

  ModelOptions opt_;
  std::string host_, endpoint_;

  mutable std::mutex log_mtx_;
  long prompt_count_;
};

#endif  // MODEL_CLIENT_H_
