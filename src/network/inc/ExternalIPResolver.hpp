#ifndef NETMETER_NETWORK_EXTERNAL_IP_RESOLVER_HPP
#define NETMETER_NETWORK_EXTERNAL_IP_RESOLVER_HPP
/**
 * @file ExternalIPResolver.hpp
 * @brief Public IP lookup across an ordered list of services with fallback.
 * @note Requests run on a worker thread; results are delivered by callback.
 *
 * Services are tried strictly in order, one at a time. The first response
 * that is 2xx and parses to a valid IP literal wins. When every service
 * fails the result carries SENTINEL_UNAVAILABLE and ALL_SERVICES_FAILED.
 *
 * At most one resolution is live: resolve() cancels the previous one and
 * aborts its request through the job's RequestToken. A cancelled job never
 * invokes its callback.
 */

#include "src/network/inc/HttpClient.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace netmeter {

namespace network {

/* ----------------------------- Constants ----------------------------- */

/// Published value when every service failed.
inline constexpr const char* SENTINEL_UNAVAILABLE = "Unavailable";

/// Published value before the first resolution completes.
inline constexpr const char* ADDRESS_UNKNOWN = "Unknown";

/// Per-request timeout.
inline constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{5000};

/// How long teardown waits for aborted workers before detaching them.
inline constexpr std::chrono::milliseconds TEARDOWN_GRACE{250};

/* ----------------------------- Services ----------------------------- */

/**
 * @brief Shape of a service's response body.
 */
enum class ResponseFormat : unsigned char {
  PLAIN_TEXT = 0,    ///< Body is the address
  JSON_IP_FIELD,     ///< {"ip": "..."}
  JSON_ORIGIN_FIELD, ///< {"origin": "a, b"}; first entry used
};

/**
 * @brief One lookup endpoint.
 */
struct IpService {
  std::string url;
  ResponseFormat format{ResponseFormat::PLAIN_TEXT};
};

/**
 * @brief Built-in services in priority order (ipify, ipinfo, httpbin).
 */
[[nodiscard]] std::vector<IpService> defaultServices();

/**
 * @brief Extract an address from a response body.
 * @param body Response body.
 * @param format Expected shape.
 * @param out Trimmed address on success.
 * @return false on empty, malformed, or non-IP content.
 */
[[nodiscard]] bool parseServiceResponse(std::string_view body, ResponseFormat format,
                                        std::string& out);

/**
 * @brief True for a textual IPv4 or IPv6 address (inet_pton).
 */
[[nodiscard]] bool isValidIpLiteral(std::string_view text) noexcept;

/* ----------------------------- Result ----------------------------- */

/**
 * @brief Outcome of one resolution.
 */
enum class ResolveStatus : unsigned char {
  OK = 0,              ///< Address resolved
  ALL_SERVICES_FAILED, ///< Every service failed; address is the sentinel
  CANCELLED,           ///< Superseded or cancelled before completion
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(ResolveStatus status) noexcept;

/**
 * @brief One service attempt.
 */
struct ResolveAttempt {
  std::string url;
  std::string outcome; ///< "ok" or failure description
};

struct ResolveResult {
  ResolveStatus status{ResolveStatus::CANCELLED};
  std::string address{SENTINEL_UNAVAILABLE};
  std::vector<ResolveAttempt> attempts; ///< One entry per network call

  [[nodiscard]] bool ok() const noexcept { return status == ResolveStatus::OK; }

  /// @brief Last failure description, empty if none.
  [[nodiscard]] std::string lastFailure() const;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ExternalIPResolver ----------------------------- */

class ExternalIPResolver {
public:
  using Callback = std::function<void(const ResolveResult&)>;

  /**
   * @param client Transport, shared with worker threads (which may outlive
   *        the resolver after teardown).
   * @param services Ordered endpoints.
   * @param timeout Per-request timeout.
   */
  explicit ExternalIPResolver(std::shared_ptr<HttpClient> client,
                              std::vector<IpService> services = defaultServices(),
                              std::chrono::milliseconds timeout = DEFAULT_REQUEST_TIMEOUT);

  /**
   * @brief Cancels and aborts every job, then joins its worker.
   *
   * A worker still stuck after TEARDOWN_GRACE (e.g. in a name lookup that
   * cannot be interrupted) is detached; it owns everything it touches and
   * never delivers its callback.
   */
  ~ExternalIPResolver();

  ExternalIPResolver(const ExternalIPResolver&) = delete;
  ExternalIPResolver& operator=(const ExternalIPResolver&) = delete;

  /**
   * @brief Start a resolution on a worker thread.
   * @param callback Invoked once on the worker thread unless cancelled.
   *
   * Cancels the previous job without waiting for its request to finish.
   * @warning The callback must not call back into this resolver.
   */
  void resolve(Callback callback);

  /// @brief Run a resolution on the calling thread.
  [[nodiscard]] ResolveResult resolveBlocking();

  /**
   * @brief Cancel the live job and abort its request.
   *
   * Does not wait for the request. After return the callback will not run.
   */
  void cancel();

  /// @brief True while a job is running and not cancelled.
  [[nodiscard]] bool inFlight() const;

  [[nodiscard]] const std::vector<IpService>& services() const noexcept { return services_; }

private:
  struct Job {
    RequestToken token;
    std::mutex mutex; // guards cancelled, finished + callback delivery
    std::condition_variable done;
    bool cancelled{false};
    bool finished{false};
  };

  static void cancelJob(Job& job);
  void reapFinished();

  std::shared_ptr<HttpClient> client_;
  std::vector<IpService> services_;
  std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_; // current_, workers_
  std::shared_ptr<Job> current_;
  std::vector<std::pair<std::shared_ptr<Job>, std::thread>> workers_;
};

} // namespace network

} // namespace netmeter

#endif // NETMETER_NETWORK_EXTERNAL_IP_RESOLVER_HPP
