#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <evobox/sandbox.h>
#include <evobox/sampler.h>
#include <evobox/evaluator.h>
#include <evobox/utils.h>
#include "model_client.h"
#include "prompt_source.h"

namespace fs = std::filesystem;

namespace {

SandboxOptions sandbox_opt;
SandboxEvaluator::Options eval_opt;
ModelOptions model_opt;
fs::path test_cases_file;
fs::path prompt_file;
int island_id = 0;
int num_evaluators = 1;
int num_samplers = 1;
long iterations = 0;
DispatchPolicy dispatch_policy = DispatchPolicy::LEAST_LOADED;

std::string ReadText(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) throw std::runtime_error("Cannot open " + path.string());
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  // sandbox
  sandbox_opt.project_root = ini[""]["project_root"] | std::string();
  sandbox_opt.imps_root = ini[""]["imps_root"] | std::string();
  sandbox_opt.eval_relpath = ini[""]["eval_relpath"] | std::string();
  sandbox_opt.setup_relpath = ini[""]["setup_relpath"] | std::string();
  sandbox_opt.interpreter = ini[""]["interpreter"] | sandbox_opt.interpreter;
  sandbox_opt.force_rebuild = ini[""]["force_rebuild"] | false;
  kPythonVersion = ini[""]["python_version"] | kPythonVersion;
  kWatchdogGrace = ini[""]["watchdog_grace"] | kWatchdogGrace;
  test_cases_file = ini[""]["test_cases"] | std::string();
  eval_opt.timeout = ini[""]["exec_timeout"] | eval_opt.timeout;
  // sampling
  num_evaluators = ini[""]["evaluators"] | num_evaluators;
  num_samplers = ini[""]["samplers"] | num_samplers;
  iterations = ini[""]["iterations"] | iterations;
  prompt_file = ini[""]["prompt_file"] | std::string();
  island_id = ini[""]["island_id"] | island_id;
  std::string policy = ini[""]["dispatch_policy"] | std::string(DispatchPolicyName(dispatch_policy));
  if (auto val = GetDispatchPolicy(policy)) {
    dispatch_policy = *val;
  } else {
    spdlog::error("Unknown dispatch policy {}", policy);
    return false;
  }
  // model
  model_opt.url = ini[""]["model_url"] | std::string();
  model_opt.model = ini[""]["model_name"] | std::string();
  model_opt.api_key = ini[""]["api_key"] | std::string();
  if (model_opt.api_key.empty()) {
    if (const char* key = std::getenv("EVOBOX_API_KEY")) model_opt.api_key = key;
  }
  model_opt.samples_per_prompt = ini[""]["samples_per_prompt"] | model_opt.samples_per_prompt;
  model_opt.native_n = ini[""]["native_n"] | model_opt.native_n;
  model_opt.log_path = ini[""]["log_path"] | std::string();
  try {
    std::string system_prompt = ini[""]["system_prompt"] | std::string();
    if (system_prompt.size()) model_opt.system_prompt = ReadText(system_prompt);
    std::string output_schema = ini[""]["output_schema"] | std::string();
    if (output_schema.size()) model_opt.output_schema = nlohmann::json::parse(ReadText(output_schema));
  } catch (std::exception& err) {
    spdlog::error("Failed to load model configuration: {}", err.what());
    return false;
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "evobox");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/evobox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-s", "--samplers")
    .scan<'d', int>()
    .help("Number of sampler threads");
  parser.add_argument("-e", "--evaluators")
    .scan<'d', int>()
    .help("Number of sandbox evaluators");
  parser.add_argument("-n", "--iterations")
    .scan<'d', long>()
    .help("Iterations per sampler; 0 for running until interrupted");
  parser.add_argument("--force-rebuild")
    .default_value(false)
    .implicit_value(true)
    .help("Rebuild the container image even if the container exists");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--samplers")) num_samplers = val.value();
  if (auto val = parser.present<int>("--evaluators")) num_evaluators = val.value();
  if (auto val = parser.present<long>("--iterations")) iterations = val.value();
  if (parser["--force-rebuild"] == true) sandbox_opt.force_rebuild = true;
  if (num_samplers < 1 || num_evaluators < 1) {
    spdlog::error("At least one sampler and one evaluator are required");
    exit(1);
  }
}

int Run() {
  std::vector<TestCase> test_cases = LoadTestCases(test_cases_file);
  eval_opt.num_tests = test_cases.size();

  std::vector<std::shared_ptr<SandboxEvaluator>> evaluators;
  for (int i = 0; i < num_evaluators; i++) {
    auto sandbox = std::make_shared<Sandbox>(sandbox_opt);
    if (i == 0) {
      sandbox->UploadTestCases(test_cases);
      sandbox_opt.force_rebuild = false;
    }
    auto evaluator = std::make_shared<SandboxEvaluator>(sandbox, eval_opt);
    evaluator->reporter.ReportResults = [](const std::string& run_id, int island,
                                           const std::vector<EvalResult>& results) {
      size_t ok = 0;
      for (auto& res : results) ok += res.status == ResultStatus::OK && res.exit_code == 0;
      spdlog::info("Run {} on island {}: {}/{} passed", run_id, island, ok, results.size());
    };
    evaluators.push_back(std::move(evaluator));
  }

  auto database = std::make_shared<FilePromptSource>(prompt_file, island_id);
  auto model = std::make_shared<OpenAIModel>(model_opt);
  std::vector<std::shared_ptr<Sampler>> samplers;
  for (int i = 0; i < num_samplers; i++) {
    auto sampler = std::make_shared<Sampler>(
        database, std::vector<std::shared_ptr<Evaluator>>(evaluators.begin(), evaluators.end()),
        model, i, dispatch_policy);
    sampler->reporter.ReportIteration = [](const Sampler& sampler, const SampleStats& stats) {
      spdlog::info("Sampler {}: prompt {:.3f}s, model {:.3f}s, dispatch {:.3f}s",
                   sampler.Uid(), stats.prompt_seconds, stats.draw_seconds,
                   stats.AverageDispatchSeconds());
    };
    samplers.push_back(std::move(sampler));
  }

  SamplerPool pool(samplers);
  pool.Start(iterations);
  pool.Join();
  for (auto& i : evaluators) i->Stop();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  try {
    return Run();
  } catch (const SandboxError& err) {
    spdlog::error("Sandbox error: {}", err.what());
  } catch (const ModelError& err) {
    spdlog::error("Model error: {}", err.what());
  }
  return 1;
}
