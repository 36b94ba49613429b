#ifndef INCLUDE_EVOBOX_SAMPLER_H_
#define INCLUDE_EVOBOX_SAMPLER_H_

#include <atomic>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <functional>

struct Prompt {
  std::string code;
  int island_id;
};

// the program database
class PromptSource {
 public:
  virtual ~PromptSource() = default;
  virtual Prompt GetPrompt() = 0;
};

class ModelClient {
 public:
  virtual ~ModelClient() = default;
  // a batch of candidate programs continuing the prompt
  virtual std::vector<std::string> DrawSamples(const std::string& prompt) = 0;
};

class Evaluator {
 public:
  virtual ~Evaluator() = default;
  // should not block
  virtual void Analyse(const std::string& candidate, int island_id, const std::string& run_id) = 0;
  // number of candidates waiting or being evaluated
  virtual size_t QueueDepth() const { return 0; }
};

#define ENUM_DISPATCH_POLICY_ \
  X(RANDOM, "random") \
  X(LEAST_LOADED, "least_loaded")
enum class DispatchPolicy {
#define X(name, str) name,
  ENUM_DISPATCH_POLICY_
#undef X
};

struct SampleStats {
  double prompt_seconds;
  double draw_seconds;
  std::vector<double> dispatch_seconds;
  size_t failed; // dispatches that threw

  SampleStats() : prompt_seconds(0), draw_seconds(0), failed(0) {}
  double AverageDispatchSeconds() const;
};

// Samples program continuations and sends them for analysis.
class Sampler {
 public:
  struct Reporter {
    // should not block
    std::function<void(const Sampler&, const SampleStats&)> ReportIteration;
  };
  Reporter reporter;

  Sampler(std::shared_ptr<PromptSource> database,
          std::vector<std::shared_ptr<Evaluator>> evaluators,
          std::shared_ptr<ModelClient> model,
          int uid = 0,
          DispatchPolicy policy = DispatchPolicy::LEAST_LOADED);

  // One iteration: get a prompt, draw a batch, dispatch every candidate.
  // Failures of the prompt source or the model propagate; a failing dispatch does not
  //   stop the rest of the batch.
  SampleStats Sample();

  int Uid() const { return uid_; }
  long GenerationNumber() const { return generation_number_; }
  void Seed(unsigned seed) { rng_.seed(seed); }

 private:
  Evaluator& PickEvaluator();

  std::shared_ptr<PromptSource> database_;
  std::vector<std::shared_ptr<Evaluator>> evaluators_;
  std::shared_ptr<ModelClient> model_;
  int uid_;
  DispatchPolicy policy_;
  long generation_number_;
  std::mt19937 rng_;
};

// Runs every sampler continuously on its own thread.
class SamplerPool {
 public:
  explicit SamplerPool(std::vector<std::shared_ptr<Sampler>> samplers);
  ~SamplerPool();

  // iterations = 0 for running until Stop()
  void Start(long iterations = 0);
  void Stop();
  void Join();

 private:
  void Loop(Sampler&, long iterations);

  std::vector<std::shared_ptr<Sampler>> samplers_;
  std::vector<std::thread> threads_;
  std::atomic_bool stop_;
};

#endif  // INCLUDE_EVOBOX_SAMPLER_H_
