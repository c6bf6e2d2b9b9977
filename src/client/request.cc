#include "conduit/client/request.h"

#include <arpa/inet.h>

#include <cctype>
#include <cstdlib>
#include <limits>

#define CONDUIT_LOG_COMPONENT "Request"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace client {

namespace {

std::string toLower(const std::string& value) {
  std::string lowered = value;
  for (auto& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered;
}

bool containsLineBreak(const std::string& value) {
  return value.find_first_of("\r\n") != std::string::npos;
}

// Request target must not split the request line or start another one
bool isValidPath(const std::string& path) {
  if (path.empty() || path[0] != '/') {
    return false;
  }
  for (char c : path) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte <= 0x20 || byte == 0x7f) {
      return false;
    }
  }
  return true;
}

bool isTokenChar(char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

bool isToken(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (char c : value) {
    if (!isTokenChar(c)) {
      return false;
    }
  }
  return true;
}

// Leading-integer parse: optional whitespace, digits, anything after the
// digits is ignored ("12abc" is 12). Unset when no digits are present.
optional<int64_t> parseLeadingInteger(const std::string& value) {
  size_t pos = 0;
  while (pos < value.size() &&
         std::isspace(static_cast<unsigned char>(value[pos]))) {
    ++pos;
  }
  bool negative = false;
  if (pos < value.size() && (value[pos] == '+' || value[pos] == '-')) {
    negative = value[pos] == '-';
    ++pos;
  }
  size_t digits_start = pos;
  int64_t result = 0;
  while (pos < value.size() &&
         std::isdigit(static_cast<unsigned char>(value[pos]))) {
    int digit = value[pos] - '0';
    if (result > (std::numeric_limits<int64_t>::max() - digit) / 10) {
      return nullopt;
    }
    result = result * 10 + digit;
    ++pos;
  }
  if (pos == digits_start) {
    return nullopt;
  }
  return negative ? -result : result;
}

}  // namespace

bool isIpLiteral(const std::string& host) {
  if (host.empty()) {
    return false;
  }
  if (host[0] == '[') {
    return true;
  }
  unsigned char buf[sizeof(struct in6_addr)];
  return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
         ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

logging::LogContext toLogContext(const TraceContext& trace,
                                 const std::string& connection_id) {
  logging::LogContext ctx;
  ctx.trace_id = trace.trace_id;
  ctx.request_id = trace.request_id;
  ctx.connection_id = connection_id;
  ctx.component = logging::Component::Request;
  return ctx;
}

Result<std::shared_ptr<Request>> Request::create(
    event::Dispatcher& dispatcher,
    RequestDescriptor descriptor,
    const std::string& hostname,
    StartCallback callback,
    std::chrono::milliseconds default_timeout) {
  return create(dispatcher, std::move(descriptor),
                RequestTarget{hostname, hostname}, std::move(callback),
                default_timeout);
}

Result<std::shared_ptr<Request>> Request::create(
    event::Dispatcher& dispatcher,
    RequestDescriptor descriptor,
    const RequestTarget& target,
    StartCallback callback,
    std::chrono::milliseconds default_timeout) {
  if (!callback) {
    return makeError<std::shared_ptr<Request>>(
        invalidArgumentError("callback must be a function"));
  }

  std::shared_ptr<Request> request(
      new Request(dispatcher, std::move(callback), descriptor.trace));

  auto result = request->init(descriptor, target, default_timeout);
  if (isError(result)) {
    CONDUIT_LOG_WITH_CONTEXT(Debug, toLogContext(descriptor.trace),
                             "rejected {} {}: {}", descriptor.method,
                             descriptor.path, errorOf(result).message);
    return makeError<std::shared_ptr<Request>>(errorOf(result));
  }
  return makeSuccess(std::move(request));
}

Request::Request(event::Dispatcher& dispatcher,
                 StartCallback callback,
                 const TraceContext& trace)
    : dispatcher_(dispatcher), callback_(std::move(callback)), trace_(trace) {}

Request::~Request() {
  disarmTimer();
  releaseSubscriptions();
}

VoidResult Request::init(RequestDescriptor& descriptor,
                         const RequestTarget& target,
                         std::chrono::milliseconds default_timeout) {
  if (!isValidPath(descriptor.path)) {
    return makeVoidError(invalidArgumentError("path must be a valid path"));
  }

  if (!isToken(descriptor.method)) {
    return makeVoidError(
        invalidArgumentError("method must be a valid token"));
  }

  if (descriptor.timeout && *descriptor.timeout < 0) {
    return makeVoidError(invalidArgumentError(
        "requestTimeout must be a positive integer or zero"));
  }

  if (descriptor.method == "CONNECT") {
    return makeVoidError(notSupportedError("CONNECT method not supported"));
  }

  method_ = descriptor.method;
  path_ = descriptor.path;
  opaque_ = descriptor.opaque;

  auto body_result = initBody(descriptor.body);
  if (isError(body_result)) {
    return body_result;
  }

  bool body_present = streaming_ || !body_.empty();
  bool safe_method = method_ == "GET" || method_ == "HEAD";

  // Some servers answer a body on GET/HEAD as a second request
  reset_ = body_present && safe_method;
  idempotent_ = descriptor.idempotent.value_or(safe_method);

  auto header_result = buildHeader(descriptor, target);
  if (isError(header_result)) {
    releaseSubscriptions();
    return header_result;
  }

  std::chrono::milliseconds timeout =
      descriptor.timeout ? std::chrono::milliseconds(*descriptor.timeout)
                         : default_timeout;
  wireCancellation(descriptor.signal, timeout);
  return makeVoidSuccess();
}

VoidResult Request::initBody(RequestBody& body) {
  if (auto* bytes = get_if<std::vector<uint8_t>>(&body)) {
    body_.assign(bytes->begin(), bytes->end());
  } else if (auto* text = get_if<std::string>(&body)) {
    body_ = std::move(*text);
  } else if (auto* stream = get_if<BodyStreamSharedPtr>(&body)) {
    if (!*stream) {
      return makeVoidError(invalidArgumentError(
          "body must be a string, a buffer or a stream"));
    }
    body_stream_ = *stream;
    streaming_ = true;

    std::weak_ptr<Request> weak_self = shared_from_this();
    body_error_subscription_ =
        body_stream_->onError([weak_self](const Error& err) {
          if (auto self = weak_self.lock()) {
            self->error(err);
          }
        });
  }
  return makeVoidSuccess();
}

VoidResult Request::buildHeader(const RequestDescriptor& descriptor,
                                const RequestTarget& target) {
  optional<std::string> host_header;

  std::string header = method_ + " " + path_ + " HTTP/1.1\r\n";
  for (const auto& entry : descriptor.headers) {
    const std::string& key = entry.first;
    const std::string& value = entry.second;

    if (key.empty() || !isToken(key)) {
      return makeVoidError(
          invalidArgumentError("invalid header name: " + key));
    }
    if (containsLineBreak(value)) {
      return makeVoidError(
          invalidArgumentError("invalid header value for " + key));
    }

    std::string lowered = toLower(key);
    // Last occurrence wins; the framing header is emitted once at write time
    if (lowered == "content-length") {
      auto parsed = parseLeadingInteger(value);
      if (!parsed || *parsed < 0) {
        return makeVoidError(invalidArgumentError("invalid content-length"));
      }
      content_length_ = static_cast<uint64_t>(*parsed);
      continue;
    }
    if (!host_header && lowered == "host") {
      host_header = value;
    }
    header += key + ": " + value + "\r\n";
  }

  if (!host_header) {
    header += "host: " + target.host_header + "\r\n";
  }
  header += "connection: keep-alive\r\n";
  header_ = std::move(header);

  if (descriptor.servername && !descriptor.servername->empty()) {
    servername_ = descriptor.servername;
  } else if (host_header && !host_header->empty()) {
    servername_ = host_header;
  } else {
    servername_ = target.hostname;
  }
  if (isIpLiteral(*servername_)) {
    servername_ = nullopt;
  }
  return makeVoidSuccess();
}

void Request::wireCancellation(const std::shared_ptr<Subscribable>& signal,
                               std::chrono::milliseconds timeout) {
  if (signal) {
    std::weak_ptr<Request> weak_self = shared_from_this();
    abort_subscription_ = signal->subscribe("abort", [weak_self]() {
      if (auto self = weak_self.lock()) {
        self->error(requestAbortedError());
      }
    });
  }

  if (timeout.count() > 0) {
    timer_ = dispatcher_.createTimer([this]() {
      // The callback chain may drop every other reference
      auto self = shared_from_this();
      error(requestTimeoutError());
    });
    timer_->enableTimer(timeout);
  }
}

void Request::headers(uint16_t status_code,
                      http::HeaderMap headers,
                      std::function<void()> resume) {
  if (status_code < 200 || finished_) {
    return;
  }
  finished_ = true;
  disarmTimer();

  CONDUIT_LOG_WITH_CONTEXT(Debug, toLogContext(trace_), "{} {} -> {}",
                           method_, path_, status_code);

  StartResponse response;
  response.status_code = status_code;
  response.headers = std::move(headers);
  response.opaque = opaque_;
  response.trace = trace_;
  response.resume = std::move(resume);

  auto self = shared_from_this();
  StartCallback callback = std::move(callback_);
  callback_ = nullptr;
  DeliverySink sink = callback(nullopt, std::move(response));

  if (errored_) {
    // error() ran inside the start callback; the sink still gets its
    // terminal delivery
    if (sink) {
      sink(error_, nullptr);
    }
    return;
  }
  sink_ = std::move(sink);
}

void Request::pushBody(const std::string& chunk) {
  if (!sink_) {
    return;
  }
  // The sink may end the request while it runs
  DeliverySink sink = sink_;
  sink(nullopt, &chunk);
}

void Request::complete(const http::HeaderPairs& /*trailers*/) {
  termination_hook_ = nullptr;
  if (sink_) {
    DeliverySink sink = std::move(sink_);
    sink_ = nullptr;
    sink(nullopt, nullptr);
  }
  releaseSubscriptions();
}

void Request::error(const Error& err) {
  bool first = !errored_;
  errored_ = true;
  if (!error_) {
    error_ = err;
  }

  if (body_stream_) {
    if (!body_stream_->destroyed()) {
      body_stream_->destroy(err);
    }
    body_stream_.reset();
  }

  if (sink_) {
    DeliverySink sink = std::move(sink_);
    sink_ = nullptr;
    sink(err, nullptr);
  }

  releaseSubscriptions();

  if (first && termination_hook_) {
    TerminationHook hook = std::move(termination_hook_);
    termination_hook_ = nullptr;
    hook(err);
  }

  if (finished_) {
    return;
  }
  finished_ = true;
  disarmTimer();

  CONDUIT_LOG_WITH_CONTEXT(Debug, toLogContext(trace_), "{} {} failed: {}",
                           method_, path_, err.message);

  StartCallback callback = std::move(callback_);
  callback_ = nullptr;
  if (callback) {
    callback(err, nullopt);
  }
}

bool Request::timerArmed() const { return timer_ && timer_->enabled(); }

void Request::disarmTimer() {
  // Only disarmed here: this may run inside the timer's own callback
  if (timer_) {
    timer_->disableTimer();
  }
}

void Request::releaseSubscriptions() {
  abort_subscription_.reset();
  body_error_subscription_.reset();
}

}  // namespace client
}  // namespace conduit
