#ifndef PROMPT_SOURCE_H_
#define PROMPT_SOURCE_H_

#include <mutex>
#include <string>
#include <filesystem>

#include <evobox/sampler.h>

namespace fs = std::filesystem;

// Serves the content of a file as the prompt of a single island. The file is
//   re-read on every call so that it can be edited while sampling.
class FilePromptSource : public PromptSource {
 public:
  FilePromptSource(const fs::path& file, int island_id);

  // throws std::runtime_error if the file is empty or unreadable
  Prompt GetPrompt() override;

 private:
  fs::path file_;
  int island_id_;
  std::mutex mtx_;
};

#endif  // PROMPT_SOURCE_H_
