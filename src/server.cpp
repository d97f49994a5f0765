#include "server.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <codnite/utils.h>
#include <codnite/report.h>
#include <codnite/language.h>
#include "http_utils.h"

std::string kListenHost = "0.0.0.0";
int kListenPort = 5001;
int kMaxParallel = 0;
size_t kMaxQueue = 20;
long kQueueWaitMs = 30000;

namespace {

const char kServiceName[] = "code-execution";
const char kHelloWorld[] = "Hello World";
constexpr int kRetryAfterSeconds = 5;
// handler threads beyond running and queued submissions, for health, cancel and rejections
constexpr size_t kSpareHandlerThreads = 4;

// Parse the body as JSON; reply 400 and return false if it is not
bool ParseBody(const httplib::Request& req, httplib::Response& res, nlohmann::json& body) {
  try {
    body = nlohmann::json::parse(req.body);
  } catch (nlohmann::json::parse_error& e) {
    spdlog::info("Malformed request body on {}: {}", req.path, e.what());
    http_utils::ReplyJson(res, HttpStatusCode(JudgeStatus::VALIDATION_ERROR), ErrorToJson(
        JudgeStatus::VALIDATION_ERROR, ValidationFailureDesc(ValidationFailure::MALFORMED_REQUEST)));
    return false;
  }
  return true;
}

void ReplyError(httplib::Response& res, const JudgeResponse& resp) {
  if (resp.status == JudgeStatus::OVERLOADED) {
    res.set_header("Retry-After", std::to_string(kRetryAfterSeconds));
  }
  http_utils::ReplyJson(res, HttpStatusCode(resp.status), ErrorToJson(resp.status, resp.details));
}

void HandleExecute(JudgeService& service, const httplib::Request& req, httplib::Response& res) {
  nlohmann::json body;
  if (!ParseBody(req, res, body)) return;
  JudgeRequest jreq;
  std::string details;
  if (!JudgeRequestFromJson(body, jreq, details)) {
    spdlog::info("Malformed execute request: {}", details);
    http_utils::ReplyJson(res, HttpStatusCode(JudgeStatus::VALIDATION_ERROR),
                          ErrorToJson(JudgeStatus::VALIDATION_ERROR, details));
    return;
  }
  JudgeResponse resp = service.Execute(std::move(jreq));
  if (resp.status != JudgeStatus::OK) return ReplyError(res, resp);
  http_utils::ReplyJson(res, 200, SubmissionResultToJson(resp.result));
}

void HandleQuickTest(JudgeService& service, const httplib::Request& req, httplib::Response& res) {
  nlohmann::json body;
  if (!ParseBody(req, res, body)) return;
  JudgeRequest jreq;
  std::string details;
  if (!JudgeRequestFromJson(body, jreq, details)) {
    http_utils::ReplyJson(res, HttpStatusCode(JudgeStatus::VALIDATION_ERROR),
                          ErrorToJson(JudgeStatus::VALIDATION_ERROR, details));
    return;
  }
  jreq.test_cases.clear();
  jreq.test_cases.push_back(TestCase{.input = "", .expected_output = kHelloWorld, .compare = {}});
  JudgeResponse resp = service.Execute(std::move(jreq));
  if (resp.status != JudgeStatus::OK) return ReplyError(res, resp);

  const SubmissionResult& result = resp.result;
  nlohmann::json ret = {{"success", result.verdict == Verdict::PASSED}};
  if (result.verdict == Verdict::COMPILE_ERROR || result.test_verdicts.empty()) {
    ret["output"] = "";
    ret["error"] = result.compile_error;
    ret["executionTime"] = 0;
    ret["exitCode"] = nullptr;
  } else {
    const TestVerdict& verdict = result.test_verdicts[0];
    ret["output"] = verdict.actual_output;
    ret["error"] = verdict.error_output.empty() ? verdict.message : verdict.error_output;
    ret["executionTime"] = verdict.elapsed_ms;
    ret["exitCode"] = verdict.exit_code;
  }
  http_utils::ReplyJson(res, 200, ret);
}

void HandleHealth(JudgeService& service, const httplib::Request&, httplib::Response& res) {
  std::string reason;
  bool healthy = SandboxHealthy(&reason);
  WorkerPool::Stats stats = service.PoolStats();
  nlohmann::json ret = {
    {"status", healthy ? "healthy" : "unhealthy"},
    {"service", kServiceName},
    {"capacity", stats.capacity},
    {"running", stats.running},
    {"queued", stats.queued},
  };
  if (!healthy) spdlog::warn("Health check failed: {}", reason);
  http_utils::ReplyJson(res, healthy ? 200 : 503, ret);
}

} // namespace

void SetupRoutes(httplib::Server& srv, JudgeService& service) {
  // an execute handler blocks for the whole judge run, so every running or queued
  //   submission gets its own thread and the worker pool stays the only queue
  WorkerPool::Stats stats = service.PoolStats();
  size_t threads = stats.capacity + stats.max_queue + kSpareHandlerThreads;
  srv.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  Route<Method::POST>(srv, "/execute", [&service](const httplib::Request& req, httplib::Response& res) {
    HandleExecute(service, req, res);
  });
  Route<Method::POST>(srv, "/test", [&service](const httplib::Request& req, httplib::Response& res) {
    HandleQuickTest(service, req, res);
  });
  Route<Method::POST>(srv, R"(/cancel/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
    std::string submission_id = req.matches[1];
    if (!service.Cancel(submission_id)) {
      http_utils::ReplyJson(res, 404, {{"error", "Submission not found"}, {"details", submission_id}});
      return;
    }
    http_utils::ReplyJson(res, 200, {{"cancelled", true}, {"submissionId", submission_id}});
  });
  Route<Method::GET>(srv, "/languages", [](const httplib::Request&, httplib::Response& res) {
    nlohmann::json ret = nlohmann::json::array();
    for (auto& lang : Languages()) ret.push_back(LanguageToJson(lang));
    http_utils::ReplyJson(res, 200, {{"languages", ret}});
  });
  Route<Method::GET>(srv, "/health", [&service](const httplib::Request& req, httplib::Response& res) {
    HandleHealth(service, req, res);
  });
  srv.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    // only fill in bodies httplib generated itself
    if (res.status == 404 && res.body.empty()) {
      http_utils::ReplyJson(res, 404, {{"error", "Endpoint not found"}});
    }
  });
}

bool ServerWorkLoop() {
  JudgeService service(kMaxParallel, kMaxQueue, std::chrono::milliseconds(kQueueWaitMs));
  httplib::Server srv;
  SetupRoutes(srv, service);
  spdlog::warn("Listening on {}:{} with {} workers, queue size {}",
               kListenHost, kListenPort, kMaxParallel, kMaxQueue);
  if (!srv.listen(kListenHost, kListenPort)) {
    spdlog::error("Failed to listen on {}:{}", kListenHost, kListenPort);
    return false;
  }
  return true;
}
