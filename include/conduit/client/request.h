#ifndef CONDUIT_CLIENT_REQUEST_H
#define CONDUIT_CLIENT_REQUEST_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "conduit/client/body_stream.h"
#include "conduit/client/subscribable.h"
#include "conduit/core/compat.h"
#include "conduit/core/result.h"
#include "conduit/event/event_loop.h"
#include "conduit/http/headers.h"
#include "conduit/logging/log_message.h"

namespace conduit {
namespace client {

// Correlation ids carried from submission into logs and the start response
struct TraceContext {
  std::string trace_id;
  std::string request_id;
};

using RequestBody = variant<std::monostate,
                            std::vector<uint8_t>,
                            std::string,
                            BodyStreamSharedPtr>;

/**
 * What the caller asks for. Headers keep insertion order and are written
 * verbatim, except content-length which is parsed into the request framing.
 */
struct RequestDescriptor {
  std::string path;
  std::string method;
  std::vector<std::pair<std::string, std::string>> headers;
  RequestBody body;
  optional<bool> idempotent;
  std::shared_ptr<void> opaque;
  optional<std::string> servername;
  std::shared_ptr<Subscribable> signal;
  // Milliseconds; 0 disables, unset falls back to the client default
  optional<int64_t> timeout;
  TraceContext trace;
};

struct StartResponse {
  uint16_t status_code{0};
  http::HeaderMap headers;
  std::shared_ptr<void> opaque;
  TraceContext trace;
  // Signals readiness for more response data
  std::function<void()> resume;
};

/**
 * Receives body chunks as (nullopt, chunk), then exactly one terminal
 * delivery: (nullopt, nullptr) on completion or (error, nullptr).
 */
using DeliverySink =
    std::function<void(const optional<Error>& error, const std::string* chunk)>;

/**
 * Invoked exactly once per request: with an error, or with the final
 * response head. The returned sink, if any, receives the body.
 */
using StartCallback = std::function<DeliverySink(
    const optional<Error>& error, optional<StartResponse> response)>;

// Connection target of a request. |hostname| is the bare origin host used
// for the default servername; |host_header| is sent when the descriptor
// carries no Host header and includes the port when it is not 80.
struct RequestTarget {
  std::string hostname;
  std::string host_header;
};

/**
 * Per-request lifecycle.
 *
 * Created through create(), which validates the descriptor and synthesizes
 * the request head. The pipeline drives it through headers(), pushBody(),
 * complete() and error(); abort and timeout converge on error(). Must only
 * be used on the dispatcher thread it was created with.
 */
class Request : public std::enable_shared_from_this<Request> {
 public:
  using TerminationHook = std::function<void(const Error& error)>;

  static Result<std::shared_ptr<Request>> create(
      event::Dispatcher& dispatcher,
      RequestDescriptor descriptor,
      const RequestTarget& target,
      StartCallback callback,
      std::chrono::milliseconds default_timeout =
          std::chrono::milliseconds(0));

  // Origin on the default port: |hostname| serves as both fields
  static Result<std::shared_ptr<Request>> create(
      event::Dispatcher& dispatcher,
      RequestDescriptor descriptor,
      const std::string& hostname,
      StartCallback callback,
      std::chrono::milliseconds default_timeout =
          std::chrono::milliseconds(0));

  ~Request();

  Request(const Request&) = delete;
  Request& operator=(const Request&) = delete;

  // Final response head. Informational statuses are ignored.
  void headers(uint16_t status_code,
               http::HeaderMap headers,
               std::function<void()> resume);

  void pushBody(const std::string& chunk);

  // Trailers are accepted and not interpreted
  void complete(const http::HeaderPairs& trailers = {});

  // Safe from any state; only the first call has observable effects
  void error(const Error& err);

  // Called from error(); lets the pipeline drop an abandoned exchange
  void setTerminationHook(TerminationHook hook) {
    termination_hook_ = std::move(hook);
  }

  const std::string& method() const { return method_; }
  const std::string& path() const { return path_; }
  const std::string& header() const { return header_; }
  const optional<uint64_t>& contentLength() const { return content_length_; }
  const std::string& body() const { return body_; }
  const BodyStreamSharedPtr& bodyStream() const { return body_stream_; }
  bool streaming() const { return streaming_; }
  bool reset() const { return reset_; }
  bool idempotent() const { return idempotent_; }
  const optional<std::string>& servername() const { return servername_; }
  const TraceContext& trace() const { return trace_; }

  bool finished() const { return finished_; }
  // error() has run at least once
  bool errored() const { return errored_; }
  bool timerArmed() const;
  bool hasAbortSubscription() const { return abort_subscription_ != nullptr; }
  bool hasDeliverySink() const { return static_cast<bool>(sink_); }

 private:
  Request(event::Dispatcher& dispatcher,
          StartCallback callback,
          const TraceContext& trace);

  VoidResult init(RequestDescriptor& descriptor,
                  const RequestTarget& target,
                  std::chrono::milliseconds default_timeout);
  VoidResult initBody(RequestBody& body);
  VoidResult buildHeader(const RequestDescriptor& descriptor,
                         const RequestTarget& target);
  void wireCancellation(const std::shared_ptr<Subscribable>& signal,
                        std::chrono::milliseconds timeout);
  void disarmTimer();
  void releaseSubscriptions();

  event::Dispatcher& dispatcher_;
  StartCallback callback_;
  TraceContext trace_;

  std::string method_;
  std::string path_;
  std::string header_;
  optional<uint64_t> content_length_;
  std::string body_;
  BodyStreamSharedPtr body_stream_;
  bool streaming_{false};
  bool reset_{false};
  bool idempotent_{false};
  optional<std::string> servername_;
  std::shared_ptr<void> opaque_;

  bool finished_{false};
  bool errored_{false};
  optional<Error> error_;
  event::TimerPtr timer_;
  SubscriptionPtr abort_subscription_;
  SubscriptionPtr body_error_subscription_;
  DeliverySink sink_;
  TerminationHook termination_hook_;
};

using RequestSharedPtr = std::shared_ptr<Request>;

// Literal IPv4 or IPv6 address, bracketed IPv6 included
bool isIpLiteral(const std::string& host);

logging::LogContext toLogContext(const TraceContext& trace,
                                 const std::string& connection_id = "");

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_REQUEST_H
