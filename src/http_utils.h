#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log & retry HTTP requests

#include <chrono>
#include <memory>
#include <thread>
#include <utility>
#include <optional>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

// request bodies can be whole prompts; only the head is logged
std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);
// 408, 429 and 5xx; other client errors are not worth retrying
bool IsRetryable(int code);

// "https://host:port/v1" -> {"https://host:port", "/v1"}; nullopt if not an http(s) URL
std::optional<std::pair<std::string, std::string>> SplitUrl(const std::string& url);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint.c_str(), std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint.c_str(), std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

template <class Method, class... T>
httplib::Result RequestRetry(int retries, std::chrono::milliseconds interval,
                             httplib::Client& cli, const std::string& endpoint, T&&... params) {
  if (retries < 1) retries = 1;
  std::unique_ptr<httplib::Result> last_res;
  for (int i = 0; i < retries; i++) {
    if (i) std::this_thread::sleep_for(interval);
    last_res = std::make_unique<httplib::Result>(HTTPRequest<Method>(cli, endpoint, params...));
    if (*last_res && http_utils::IsSuccess((*last_res)->status)) return std::move(*last_res);
    spdlog::debug("Error code={} status={}", (int)last_res->error(), *last_res ? (*last_res)->status : -1);
    if (*last_res && !http_utils::IsRetryable((*last_res)->status)) break;
  }
  spdlog::warn("Request {} {} failed after {} attempts", Method::method_name, endpoint, retries);
  return std::move(*last_res);
}

bool IsSuccess(const httplib::Result& res);

#endif  // HTTP_UTILS_H_
