#include "prompt_source.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

FilePromptSource::FilePromptSource(const fs::path& file, int island_id) :
    file_(file), island_id_(island_id) {}

Prompt FilePromptSource::GetPrompt() {
  std::lock_guard lck(mtx_);
  std::ifstream fin(file_);
  std::stringstream ss;
  if (fin) ss << fin.rdbuf();
  std::string code = ss.str();
  if (code.empty()) throw std::runtime_error("Cannot read prompt from " + file_.string());
  spdlog::debug("Prompt of {} bytes for island {}", code.size(), island_id_);
  return {std::move(code), island_id_};
}
