#include "http_utils.h"

#include <regex>
#include <fmt/ranges.h>

namespace http_utils {

namespace {

constexpr size_t kMaxLoggedBody = 200;

} // namespace

std::string FormatOneParam(const char* str) {
  return FormatOneParam(std::string(str));
}
std::string FormatOneParam(const std::string& str) {
  if (str.size() <= kMaxLoggedBody) return str;
  return fmt::format("{}...({} bytes)", str.substr(0, kMaxLoggedBody), str.size());
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

bool IsRetryable(int code) {
  return code == 408 || code == 429 || code >= 500;
}

std::optional<std::pair<std::string, std::string>> SplitUrl(const std::string& url) {
  static const std::regex kUrlRegex("^(https?://[^/]+)(/.*)?$");
  std::smatch match;
  if (!std::regex_match(url, match, kUrlRegex)) return std::nullopt;
  std::string prefix = match[2].str();
  while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
  return std::make_pair(match[1].str(), prefix);
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}
