#include <evobox/sampler.h>

#include <chrono>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

using Clock = std::chrono::steady_clock;

inline double SecondsSince(Clock::time_point start) {
  return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

double SampleStats::AverageDispatchSeconds() const {
  if (dispatch_seconds.empty()) return 0;
  double sum = 0;
  for (double i : dispatch_seconds) sum += i;
  return sum / dispatch_seconds.size();
}

Sampler::Sampler(std::shared_ptr<PromptSource> database,
                 std::vector<std::shared_ptr<Evaluator>> evaluators,
                 std::shared_ptr<ModelClient> model,
                 int uid, DispatchPolicy policy) :
    database_(std::move(database)), evaluators_(std::move(evaluators)), model_(std::move(model)),
    uid_(uid), policy_(policy), generation_number_(0), rng_(std::random_device{}()) {
  if (!database_ || !model_) throw std::invalid_argument("Sampler needs a prompt source and a model");
  if (evaluators_.empty()) throw std::invalid_argument("Sampler needs at least one evaluator");
  for (auto& i : evaluators_) {
    if (!i) throw std::invalid_argument("Sampler got a null evaluator");
  }
}

Evaluator& Sampler::PickEvaluator() {
  if (policy_ == DispatchPolicy::RANDOM) {
    return *evaluators_[std::uniform_int_distribution<size_t>(0, evaluators_.size() - 1)(rng_)];
  }
  // least loaded; ties broken uniformly
  std::vector<size_t> best;
  size_t best_depth = std::numeric_limits<size_t>::max();
  for (size_t i = 0; i < evaluators_.size(); i++) {
    size_t depth = evaluators_[i]->QueueDepth();
    if (depth < best_depth) {
      best_depth = depth;
      best.clear();
    }
    if (depth == best_depth) best.push_back(i);
  }
  return *evaluators_[best[std::uniform_int_distribution<size_t>(0, best.size() - 1)(rng_)]];
}

SampleStats Sampler::Sample() {
  SampleStats stats;
  auto start = Clock::now();
  Prompt prompt = database_->GetPrompt();
  stats.prompt_seconds = SecondsSince(start);

  start = Clock::now();
  std::vector<std::string> samples = model_->DrawSamples(prompt.code);
  stats.draw_seconds = SecondsSince(start);
  spdlog::debug("Sampler {}: drew {} samples in {:.3f}s", uid_, samples.size(), stats.draw_seconds);

  for (auto& sample : samples) {
    std::string run_id = fmt::format("{}_{}", uid_, generation_number_++);
    start = Clock::now();
    try {
      PickEvaluator().Analyse(sample, prompt.island_id, run_id);
    } catch (const std::exception& err) {
      spdlog::error("Sampler {}: dispatching {} failed: {}", uid_, run_id, err.what());
      stats.failed++;
    }
    stats.dispatch_seconds.push_back(SecondsSince(start));
  }
  spdlog::debug("Sampler {}: prompt {:.3f}s, draw {:.3f}s, dispatch avg {:.3f}s ({} failed)",
                uid_, stats.prompt_seconds, stats.draw_seconds,
                stats.AverageDispatchSeconds(), stats.failed);
  if (reporter.ReportIteration) reporter.ReportIteration(*this, stats);
  return stats;
}

SamplerPool::SamplerPool(std::vector<std::shared_ptr<Sampler>> samplers) :
    samplers_(std::move(samplers)), stop_(false) {}

SamplerPool::~SamplerPool() {
  Stop();
  Join();
}

void SamplerPool::Start(long iterations) {
  stop_ = false;
  for (auto& i : samplers_) {
    threads_.emplace_back(&SamplerPool::Loop, this, std::ref(*i), iterations);
  }
  spdlog::info("Started {} samplers", samplers_.size());
}

void SamplerPool::Stop() {
  stop_ = true;
}

void SamplerPool::Join() {
  for (auto& i : threads_) {
    if (i.joinable()) i.join();
  }
  threads_.clear();
}

void SamplerPool::Loop(Sampler& sampler, long iterations) {
  for (long it = 0; !stop_ && (iterations <= 0 || it < iterations); it++) {
    try {
      sampler.Sample();
    } catch (const std::exception& err) {
      spdlog::error("Sampler {}: iteration {} failed: {}", sampler.Uid(), it, err.what());
    }
  }
  spdlog::info("Sampler {} stopped after generation {}", sampler.Uid(), sampler.GenerationNumber());
}
