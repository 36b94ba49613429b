#include <evobox/evaluator.h>

#include <spdlog/spdlog.h>
#include <evobox/paths.h>
#include "utils.h"

SandboxEvaluator::SandboxEvaluator(std::shared_ptr<Sandbox> sandbox, const Options& opt) :
    sandbox_(std::move(sandbox)), opt_(opt), running_(0), stopping_(false) {
  if (!sandbox_) throw std::invalid_argument("SandboxEvaluator needs a sandbox");
  worker_ = std::thread(&SandboxEvaluator::WorkLoop, this);
}

SandboxEvaluator::~SandboxEvaluator() {
  Stop();
}

void SandboxEvaluator::Analyse(const std::string& candidate, int island_id, const std::string& run_id) {
  if (!IsValidImplementationId(run_id)) {
    throw ConfigurationError("Invalid run id '" + run_id + "'");
  }
  {
    std::lock_guard lck(mtx_);
    if (stopping_) throw std::runtime_error("Evaluator is stopped");
    queue_.push_back({candidate, island_id, run_id});
  }
  cv_.notify_one();
}

size_t SandboxEvaluator::QueueDepth() const {
  std::lock_guard lck(mtx_);
  return queue_.size() + running_;
}

void SandboxEvaluator::WaitIdle() {
  std::unique_lock lck(mtx_);
  idle_cv_.wait(lck, [this]() { return queue_.empty() && !running_; });
}

void SandboxEvaluator::Stop() {
  {
    std::lock_guard lck(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void SandboxEvaluator::WorkLoop() {
  while (true) {
    Job job;
    {
      std::unique_lock lck(mtx_);
      cv_.wait(lck, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break; // stopping and drained
      job = std::move(queue_.front());
      queue_.pop_front();
      running_++;
    }
    std::vector<EvalResult> results;
    try {
      results = Evaluate(job);
    } catch (const std::exception& err) {
      spdlog::error("Evaluation of {} failed: {}", job.run_id, err.what());
    }
    if (reporter.ReportResults) {
      try {
        reporter.ReportResults(job.run_id, job.island_id, results);
      } catch (const std::exception& err) {
        spdlog::error("Reporting results of {} failed: {}", job.run_id, err.what());
      }
    }
    {
      std::lock_guard lck(mtx_);
      running_--;
    }
    idle_cv_.notify_all();
  }
}

std::vector<EvalResult> SandboxEvaluator::Evaluate(const Job& job) {
  fs::path dir = ImplementationPath(sandbox_->Options().imps_root, job.run_id);
  if (!CreateDirs(dir) || !WriteFile(dir / opt_.implementation_file, job.candidate)) {
    spdlog::error("Cannot store implementation {} under {}", job.run_id, dir.c_str());
    return {};
  }
  std::vector<EvalResult> results;
  int ok = 0;
  for (int i = 0; i < opt_.num_tests; i++) {
    results.push_back(sandbox_->Run(job.run_id, i, opt_.timeout));
    if (results.back().status == ResultStatus::OK && results.back().exit_code == 0) ok++;
  }
  spdlog::info("Implementation {} (island {}): {}/{} test cases succeeded",
               job.run_id, job.island_id, ok, opt_.num_tests);
  return results;
}
