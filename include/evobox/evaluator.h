#ifndef INCLUDE_EVOBOX_EVALUATOR_H_
#define INCLUDE_EVOBOX_EVALUATOR_H_

#include <deque>
#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <functional>
#include <condition_variable>

#include <evobox/sandbox.h>
#include <evobox/sampler.h>

// Stores each candidate as an implementation and runs it against all uploaded test cases.
class SandboxEvaluator : public Evaluator {
 public:
  struct Options {
    std::string implementation_file; // file name under {imps_root}/{run_id}/
    int num_tests;
    double timeout; // seconds per test case

    Options() : implementation_file("implementation.py"), num_tests(0), timeout(30.0) {}
  };
  struct Reporter {
    // called from the worker thread; should not block
    std::function<void(const std::string& run_id, int island_id,
                       const std::vector<EvalResult>&)> ReportResults;
  };
  // must be set before the first Analyse
  Reporter reporter;

  SandboxEvaluator(std::shared_ptr<Sandbox> sandbox, const Options& opt);
  ~SandboxEvaluator() override;

  void Analyse(const std::string& candidate, int island_id, const std::string& run_id) override;
  size_t QueueDepth() const override;

  // block until every queued candidate is evaluated
  void WaitIdle();
  // evaluate the remaining queue and join the worker
  void Stop();

 private:
  struct Job {
    std::string candidate;
    int island_id;
    std::string run_id;
  };

  void WorkLoop();
  std::vector<EvalResult> Evaluate(const Job&);

  std::shared_ptr<Sandbox> sandbox_;
  Options opt_;

  mutable std::mutex mtx_;
  std::condition_variable cv_, idle_cv_;
  std::deque<Job> queue_;
  size_t running_;
  bool stopping_;
  std::thread worker_;
};

#endif  // INCLUDE_EVOBOX_EVALUATOR_H_
