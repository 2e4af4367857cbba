#ifndef NETMETER_NETWORK_HTTP_CLIENT_HPP
#define NETMETER_NETWORK_HTTP_CLIENT_HPP
/**
 * @file HttpClient.hpp
 * @brief Blocking HTTP GET seam with an overall deadline and cross-thread abort.
 *
 * The production transport is cpp-httplib built with OpenSSL support. One
 * request per connection; redirects are not followed.
 *
 * @warning Blocking: call from a worker thread, never the event loop.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace netmeter {

namespace network {

/* ----------------------------- Constants ----------------------------- */

/// Upper bound on a response held in memory.
inline constexpr std::size_t MAX_RESPONSE_BYTES = 256 * 1024;

/* ----------------------------- HttpStatus ----------------------------- */

/**
 * @brief Transport-level outcome of a request.
 */
enum class HttpStatus : unsigned char {
  OK = 0,         ///< Response received (any HTTP status code)
  INVALID_URL,    ///< URL could not be parsed or scheme unsupported
  CONNECT_FAILED, ///< Name lookup or TCP connect failed
  TLS_FAILED,     ///< Handshake or certificate verification failed
  TIMEOUT,        ///< Overall deadline passed
  IO_ERROR,       ///< Socket error mid-transfer
  BAD_RESPONSE,   ///< Malformed or oversized response
  CANCELLED,      ///< Aborted through the request token
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(HttpStatus status) noexcept;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Parsed absolute URL.
 */
struct Url {
  std::string scheme;    ///< "http" or "https"
  std::string host;      ///< Host name or literal
  std::uint16_t port{0}; ///< Explicit or scheme default
  std::string target;    ///< Path + query, at least "/"
};

/**
 * @brief HTTP response.
 */
struct HttpResponse {
  int statusCode{0}; ///< e.g. 200
  std::string body;  ///< Decoded body

  /// @brief True for 2xx status codes.
  [[nodiscard]] bool isSuccess() const noexcept { return statusCode >= 200 && statusCode < 300; }
};

/**
 * @brief Parse an absolute http/https URL.
 * @return false on malformed input, userinfo, or unsupported scheme.
 */
[[nodiscard]] bool parseUrl(std::string_view text, Url& out);

/* ----------------------------- RequestToken ----------------------------- */

/**
 * @brief Cancels a request from another thread.
 *
 * A transport arms the token with an abort hook for the duration of a
 * request. cancel() marks the token and runs the hook under the token's
 * lock, so disarm() waits out a hook that is running. Hooks must not block.
 */
class RequestToken {
public:
  using Abort = std::function<void()>;

  /// @brief Mark cancelled and run the armed hook, if any. Idempotent.
  void cancel();

  [[nodiscard]] bool cancelled() const;

  /**
   * @brief Install the abort hook.
   * @return false if already cancelled (hook not installed).
   */
  [[nodiscard]] bool arm(Abort abort);

  /// @brief Remove the hook; waits for a running hook to return.
  void disarm();

private:
  mutable std::mutex mutex_;
  bool cancelled_{false};
  Abort abort_;
};

/* ----------------------------- HttpClient ----------------------------- */

/**
 * @brief GET transport used by the external-IP resolver.
 *
 * Implementations must return within roughly @p timeout of the call and
 * must return promptly (CANCELLED) once @p token is cancelled.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * @brief Perform a GET request.
   * @param url Absolute URL.
   * @param timeout Overall deadline for connect, send and receive.
   * @param token Abort handle; may be cancelled from any thread.
   * @param out Response on OK.
   */
  [[nodiscard]] virtual HttpStatus get(const std::string& url, std::chrono::milliseconds timeout,
                                       RequestToken& token, HttpResponse& out) = 0;
};

/**
 * @brief HttpClient over cpp-httplib.
 *
 * https verifies the peer against the system trust store, checks the host
 * name and sends SNI (OpenSSL through httplib). A per-request watcher
 * thread stops the connection when the deadline passes or the token is
 * cancelled.
 */
class TlsHttpClient final : public HttpClient {
public:
  [[nodiscard]] HttpStatus get(const std::string& url, std::chrono::milliseconds timeout,
                               RequestToken& token, HttpResponse& out) override;
};

} // namespace network

} // namespace netmeter

#endif // NETMETER_NETWORK_HTTP_CLIENT_HPP
