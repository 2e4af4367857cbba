/**
 * @file ExternalIPResolver.cpp
 * @brief Sequential service fallback on a worker thread.
 */

#include "src/network/inc/ExternalIPResolver.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <arpa/inet.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace network {

using netmeter::helpers::strings::beforeFirst;
using netmeter::helpers::strings::trim;

namespace {

/// Longest textual IPv6 address plus scope suffix headroom.
constexpr std::size_t MAX_ADDRESS_LENGTH = 64;

/// Parse a JSON object and return the named string member.
bool jsonStringField(std::string_view body, const char* key, std::string& out) {
  const nlohmann::json DOC = nlohmann::json::parse(body.begin(), body.end(), nullptr,
                                                      /*allow_exceptions=*/false);
  if (DOC.is_discarded() || !DOC.is_object()) {
    return false;
  }
  const auto IT = DOC.find(key);
  if (IT == DOC.end() || !IT->is_string()) {
    return false;
  }
  out = IT->get<std::string>();
  return true;
}

} // namespace

/* ----------------------------- Services ----------------------------- */

std::vector<IpService> defaultServices() {
  return {
      {"https://api.ipify.org", ResponseFormat::PLAIN_TEXT},
      {"https://ipinfo.io/json", ResponseFormat::JSON_IP_FIELD},
      {"https://httpbin.org/ip", ResponseFormat::JSON_ORIGIN_FIELD},
  };
}

bool isValidIpLiteral(std::string_view text) noexcept {
  if (text.empty() || text.size() >= MAX_ADDRESS_LENGTH) {
    return false;
  }

  char buf[MAX_ADDRESS_LENGTH];
  text.copy(buf, text.size());
  buf[text.size()] = '\0';

  unsigned char addr[sizeof(struct in6_addr)];
  return ::inet_pton(AF_INET, buf, addr) == 1 || ::inet_pton(AF_INET6, buf, addr) == 1;
}

bool parseServiceResponse(std::string_view body, ResponseFormat format, std::string& out) {
  std::string value;

  switch (format) {
  case ResponseFormat::PLAIN_TEXT:
    value = std::string(trim(body));
    break;
  case ResponseFormat::JSON_IP_FIELD:
    if (!jsonStringField(body, "ip", value)) {
      return false;
    }
    break;
  case ResponseFormat::JSON_ORIGIN_FIELD:
    if (!jsonStringField(body, "origin", value)) {
      return false;
    }
    // Proxies append hops: "client, proxy1, proxy2".
    value = std::string(beforeFirst(value, ','));
    break;
  }

  const std::string_view TRIMMED = trim(value);
  if (!isValidIpLiteral(TRIMMED)) {
    return false;
  }
  out = std::string(TRIMMED);
  return true;
}

/* ----------------------------- ResolveStatus ----------------------------- */

const char* toString(ResolveStatus status) noexcept {
  switch (status) {
  case ResolveStatus::OK:
    return "ok";
  case ResolveStatus::ALL_SERVICES_FAILED:
    return "all services failed";
  case ResolveStatus::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

/* ----------------------------- ResolveResult ----------------------------- */

std::string ResolveResult::lastFailure() const {
  for (auto it = attempts.rbegin(); it != attempts.rend(); ++it) {
    if (it->outcome != "ok") {
      return it->outcome;
    }
  }
  return {};
}

std::string ResolveResult::toString() const {
  return fmt::format("{} ({}, {} attempt{})", address, network::toString(status), attempts.size(),
                     attempts.size() == 1 ? "" : "s");
}

/* ----------------------------- Service Walk ----------------------------- */

namespace {

/// Try each service in order until one yields an address or the token is cancelled.
ResolveResult runServices(HttpClient& client, const std::vector<IpService>& services,
                          std::chrono::milliseconds timeout, RequestToken& token) {
  ResolveResult result;

  for (const IpService& SERVICE : services) {
    if (token.cancelled()) {
      result.status = ResolveStatus::CANCELLED;
      return result;
    }

    ResolveAttempt attempt;
    attempt.url = SERVICE.url;

    HttpResponse resp;
    const HttpStatus ST = client.get(SERVICE.url, timeout, token, resp);
    std::string address;

    if (ST == HttpStatus::CANCELLED) {
      result.status = ResolveStatus::CANCELLED;
      return result;
    }
    if (ST != HttpStatus::OK) {
      attempt.outcome = toString(ST);
    } else if (!resp.isSuccess()) {
      attempt.outcome = fmt::format("HTTP {}", resp.statusCode);
    } else if (resp.body.empty()) {
      attempt.outcome = "empty body";
    } else if (!parseServiceResponse(resp.body, SERVICE.format, address)) {
      attempt.outcome = "unparseable response";
    } else {
      attempt.outcome = "ok";
    }

    SPDLOG_DEBUG("External IP service {}: {}", SERVICE.url, attempt.outcome);
    result.attempts.push_back(std::move(attempt));

    if (!address.empty()) {
      result.status = ResolveStatus::OK;
      result.address = std::move(address);
      SPDLOG_INFO("External IP resolved: {} via {}", result.address, SERVICE.url);
      return result;
    }
  }

  result.status = ResolveStatus::ALL_SERVICES_FAILED;
  result.address = SENTINEL_UNAVAILABLE;
  SPDLOG_WARN("External IP lookup failed on all {} services (last: {})", services.size(),
              result.lastFailure());
  return result;
}

} // namespace

/* ----------------------------- ExternalIPResolver ----------------------------- */

ExternalIPResolver::ExternalIPResolver(std::shared_ptr<HttpClient> client,
                                       std::vector<IpService> services,
                                       std::chrono::milliseconds timeout)
    : client_(std::move(client)), services_(std::move(services)), timeout_(timeout) {}

ExternalIPResolver::~ExternalIPResolver() {
  cancel();

  std::vector<std::pair<std::shared_ptr<Job>, std::thread>> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    cancelJob(*worker.first);
  }

  const auto GRACE_END = std::chrono::steady_clock::now() + TEARDOWN_GRACE;
  for (auto& [job, thread] : workers) {
    bool finished = false;
    {
      std::unique_lock<std::mutex> lock(job->mutex);
      finished = job->done.wait_until(lock, GRACE_END, [&job]() { return job->finished; });
    }
    if (finished) {
      thread.join();
    } else {
      SPDLOG_DEBUG("External IP worker still blocked at teardown; detaching");
      thread.detach();
    }
  }
}

void ExternalIPResolver::cancelJob(Job& job) {
  // Abort first: the hook never blocks, and the job lock may be held by a
  // callback that is being delivered.
  job.token.cancel();

  std::lock_guard<std::mutex> lock(job.mutex);
  if (!job.finished && !job.cancelled) {
    SPDLOG_DEBUG("Cancelling in-flight external IP lookup");
  }
  job.cancelled = true;
}

void ExternalIPResolver::resolve(Callback callback) {
  cancel();
  reapFinished();

  auto job = std::make_shared<Job>();

  // The worker owns what it uses so that it may outlive the resolver.
  std::thread worker([client = client_, services = services_, timeout = timeout_, job,
                      cb = std::move(callback)]() {
    const ResolveResult RESULT = runServices(*client, services, timeout, job->token);
    {
      std::lock_guard<std::mutex> lock(job->mutex);
      job->finished = true;
      if (!job->cancelled && RESULT.status != ResolveStatus::CANCELLED && cb) {
        cb(RESULT);
      }
    }
    job->done.notify_all();
  });

  std::lock_guard<std::mutex> lock(mutex_);
  current_ = job;
  workers_.emplace_back(std::move(job), std::move(worker));
}

ResolveResult ExternalIPResolver::resolveBlocking() {
  RequestToken token;
  return runServices(*client_, services_, timeout_, token);
}

void ExternalIPResolver::cancel() {
  std::shared_ptr<Job> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    job = std::move(current_);
    current_.reset();
  }
  if (job) {
    // Waits out a callback that is being delivered.
    cancelJob(*job);
  }
}

bool ExternalIPResolver::inFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!current_) {
    return false;
  }
  std::lock_guard<std::mutex> jobLock(current_->mutex);
  return !current_->finished && !current_->cancelled;
}

void ExternalIPResolver::reapFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = workers_.begin(); it != workers_.end();) {
    bool finished = false;
    {
      std::lock_guard<std::mutex> jobLock(it->first->mutex);
      finished = it->first->finished;
    }
    if (finished) {
      // The worker has released the job; join returns promptly.
      it->second.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace network

} // namespace netmeter
