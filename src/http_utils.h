#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <string>
#include <exception>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#define ENUM_METHOD_ \
  X(GET, Get) \
  X(POST, Post)
enum class Method {
#define X(name, func) name,
  ENUM_METHOD_
#undef X
};

namespace http_utils {

// request parameters for debug logs
std::string FormatParams(const httplib::Params&);

bool IsSuccess(int code);

// invalid UTF-8 from user programs is replaced instead of throwing
void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body);

} // namespace http_utils

// Register a handler that logs method, path, status and latency of every request.
// Exceptions escaping the handler become 500 with a generic body.
template <Method kMethod, class Func>
void Route(httplib::Server& srv, const std::string& pattern, Func&& func) {
  auto handler = [func = std::forward<Func>(func)](const httplib::Request& req, httplib::Response& res) {
    auto start = std::chrono::steady_clock::now();
    spdlog::debug("{} params {}", req.path, http_utils::FormatParams(req.params));
    try {
      func(req, res);
    } catch (std::exception& e) {
      spdlog::error("Unhandled error in {} {}: {}", req.method, req.path, e.what());
      http_utils::ReplyJson(res, 500, {
          {"error", "Internal server error"},
          {"details", "An unexpected error occurred"}});
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::log(http_utils::IsSuccess(res.status) ? spdlog::level::info : spdlog::level::warn,
                "{} {} {} {}ms", req.method, req.path, res.status, elapsed.count());
  };
#define X(name, func) if constexpr (kMethod == Method::name) srv.func(pattern, handler);
  ENUM_METHOD_
#undef X
}

#endif  // HTTP_UTILS_H_
