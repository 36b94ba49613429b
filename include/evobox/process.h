#ifndef INCLUDE_EVOBOX_PROCESS_H_
#define INCLUDE_EVOBOX_PROCESS_H_

#include <string>
#include <vector>

// Outcome of one external command.
struct ProcessResult {
  int exit_code; // 128 + signal if killed by a signal; -1 if not spawned
  bool signaled;
  bool timed_out; // killed by the watchdog
  bool spawn_failed;
  std::string out, err;

  ProcessResult() : exit_code(-1), signaled(false), timed_out(false), spawn_failed(false) {}
  bool Success() const { return !spawn_failed && !timed_out && exit_code == 0; }
};

struct ProcessOptions {
  double timeout; // seconds; 0 for no limit
  bool capture_output; // otherwise output is read and discarded

  ProcessOptions() : timeout(0), capture_output(true) {}
  explicit ProcessOptions(double timeout) : timeout(timeout), capture_output(true) {}
};

// All external commands (container engine invocations) go through a CommandRunner,
//   so that tests can replace it with a recording fake.
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;
  // argv[0] is looked up in PATH; no shell is involved
  virtual ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions&) = 0;
};

// fork & exec in a new process group; on timeout the whole group is killed
class SubprocessRunner : public CommandRunner {
 public:
  ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions&) override;
};

// logging
std::string FormatCommand(const std::vector<std::string>& argv);
std::string DescribeResult(const ProcessResult&);

#endif  // INCLUDE_EVOBOX_PROCESS_H_
