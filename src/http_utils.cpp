#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatParams(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

void ReplyJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

} // namespace http_utils
