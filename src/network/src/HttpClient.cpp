/**
 * @file HttpClient.cpp
 * @brief HTTP GET over cpp-httplib with a deadline/abort watcher.
 */

#include "src/network/inc/HttpClient.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>
#include <condition_variable>
#include <thread>
#include <utility>

#include <httplib.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace netmeter {

namespace network {

using netmeter::helpers::strings::equalsIgnoreCase;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::uint16_t HTTP_PORT = 80;
constexpr std::uint16_t HTTPS_PORT = 443;
constexpr const char* USER_AGENT = "netmeter";

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Stops a client when its deadline passes or abort() is called.
 *
 * httplib::Client::stop() may wait for a connect in progress, so it runs on
 * the watcher thread and never on the thread that asked for the abort.
 */
class RequestWatch {
public:
  RequestWatch(httplib::Client& client, std::chrono::steady_clock::time_point deadline)
      : client_(client), thread_([this, deadline]() { watch(deadline); }) {}

  ~RequestWatch() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    cv_.notify_all();
    thread_.join();
  }

  RequestWatch(const RequestWatch&) = delete;
  RequestWatch& operator=(const RequestWatch&) = delete;

  void abort() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      aborted_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool expired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expired_;
  }

private:
  void watch(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_until(lock, deadline, [this]() { return done_ || aborted_; })) {
      if (done_) {
        return;
      }
    } else {
      expired_ = true;
    }
    lock.unlock();
    client_.stop();
  }

  httplib::Client& client_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool done_{false};
  bool aborted_{false};
  bool expired_{false};
  std::thread thread_; // last: starts after the state above exists
};

HttpStatus fromHttplibError(httplib::Error err) noexcept {
  switch (err) {
  case httplib::Error::Connection:
  case httplib::Error::BindIPAddress:
    return HttpStatus::CONNECT_FAILED;
  case httplib::Error::SSLConnection:
  case httplib::Error::SSLLoadingCerts:
  case httplib::Error::SSLServerVerification:
    return HttpStatus::TLS_FAILED;
  default:
    return HttpStatus::IO_ERROR;
  }
}

} // namespace

/* ----------------------------- HttpStatus ----------------------------- */

const char* toString(HttpStatus status) noexcept {
  switch (status) {
  case HttpStatus::OK:
    return "ok";
  case HttpStatus::INVALID_URL:
    return "invalid url";
  case HttpStatus::CONNECT_FAILED:
    return "connect failed";
  case HttpStatus::TLS_FAILED:
    return "tls handshake failed";
  case HttpStatus::TIMEOUT:
    return "timed out";
  case HttpStatus::IO_ERROR:
    return "i/o error";
  case HttpStatus::BAD_RESPONSE:
    return "malformed response";
  case HttpStatus::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

/* ----------------------------- API ----------------------------- */

bool parseUrl(std::string_view text, Url& out) {
  const std::size_t SCHEME_END = text.find("://");
  if (SCHEME_END == std::string_view::npos) {
    return false;
  }

  Url url;
  const std::string_view SCHEME = text.substr(0, SCHEME_END);
  if (equalsIgnoreCase(SCHEME, "https")) {
    url.scheme = "https";
    url.port = HTTPS_PORT;
  } else if (equalsIgnoreCase(SCHEME, "http")) {
    url.scheme = "http";
    url.port = HTTP_PORT;
  } else {
    return false;
  }

  std::string_view rest = text.substr(SCHEME_END + 3);
  const std::size_t PATH_START = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, PATH_START);
  url.target = (PATH_START == std::string_view::npos) ? "/" : std::string(rest.substr(PATH_START));
  if (url.target.front() == '?') {
    url.target.insert(url.target.begin(), '/');
  }

  if (authority.find('@') != std::string_view::npos) {
    return false;
  }

  // A colon inside "[v6]" is not a port separator.
  const std::size_t COLON = authority.rfind(':');
  const std::size_t BRACKET = authority.rfind(']');
  if (COLON != std::string_view::npos && (BRACKET == std::string_view::npos || COLON > BRACKET)) {
    const std::string_view PORT = authority.substr(COLON + 1);
    unsigned int port = 0;
    const auto [PTR, EC] = std::from_chars(PORT.data(), PORT.data() + PORT.size(), port);
    if (EC != std::errc{} || PTR != PORT.data() + PORT.size() || port == 0 || port > 65535) {
      return false;
    }
    url.port = static_cast<std::uint16_t>(port);
    authority = authority.substr(0, COLON);
  }

  if (authority.empty()) {
    return false;
  }
  url.host = std::string(authority);
  out = std::move(url);
  return true;
}

/* ----------------------------- RequestToken ----------------------------- */

void RequestToken::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
  if (abort_) {
    abort_();
  }
}

bool RequestToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool RequestToken::arm(Abort abort) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return false;
  }
  abort_ = std::move(abort);
  return true;
}

void RequestToken::disarm() {
  std::lock_guard<std::mutex> lock(mutex_);
  abort_ = nullptr;
}

/* ----------------------------- TlsHttpClient ----------------------------- */

HttpStatus TlsHttpClient::get(const std::string& urlText, std::chrono::milliseconds timeout,
                              RequestToken& token, HttpResponse& out) {
  Url url;
  if (!parseUrl(urlText, url)) {
    return HttpStatus::INVALID_URL;
  }

  httplib::Client client(fmt::format("{}://{}:{}", url.scheme, url.host, url.port));
  if (!client.is_valid()) {
    return HttpStatus::INVALID_URL;
  }
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
  client.set_keep_alive(false);
  client.set_follow_location(false);
  client.enable_server_certificate_verification(true);

  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  const httplib::Headers HEADERS = {{"User-Agent", USER_AGENT}, {"Accept", "*/*"}};
  bool oversized = false;

  RequestWatch watch(client, DEADLINE);
  if (!token.arm([&watch]() { watch.abort(); })) {
    return HttpStatus::CANCELLED;
  }

  httplib::Result res =
      client.Get(url.target, HEADERS, [&](std::uint64_t current, std::uint64_t /*total*/) {
        if (current > MAX_RESPONSE_BYTES) {
          oversized = true;
          return false;
        }
        return !token.cancelled() && std::chrono::steady_clock::now() < DEADLINE;
      });
  token.disarm();

  if (res) {
    out.statusCode = res->status;
    out.body = std::move(res->body);
    return HttpStatus::OK;
  }

  if (token.cancelled()) {
    return HttpStatus::CANCELLED;
  }
  if (oversized) {
    return HttpStatus::BAD_RESPONSE;
  }
  if (watch.expired() || std::chrono::steady_clock::now() >= DEADLINE) {
    return HttpStatus::TIMEOUT;
  }

  SPDLOG_DEBUG("GET {} failed: {}", urlText, httplib::to_string(res.error()));
  return fromHttplibError(res.error());
}

} // namespace network

} // namespace netmeter
