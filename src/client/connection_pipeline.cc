#include "conduit/client/connection_pipeline.h"

#include <cerrno>
#include <stdexcept>

#include "conduit/http/wire_serializer.h"

#define CONDUIT_LOG_COMPONENT "Pipeline"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace client {

const char* pipelineStateName(PipelineState state) {
  switch (state) {
    case PipelineState::Connecting:
      return "Connecting";
    case PipelineState::Ready:
      return "Ready";
    case PipelineState::Busy:
      return "Busy";
    case PipelineState::Closed:
      return "Closed";
  }
  return "Unknown";
}

ConnectionPipeline::ConnectionPipeline(
    event::Dispatcher& dispatcher,
    network::TransportFactory transport_factory,
    Options options)
    : dispatcher_(dispatcher),
      transport_factory_(std::move(transport_factory)),
      options_(std::move(options)),
      alive_(std::make_shared<bool>(true)) {
  if (options_.max_in_flight != 1) {
    throw std::invalid_argument("max_in_flight must be 1");
  }
  if (options_.read_chunk_size == 0) {
    throw std::invalid_argument("read_chunk_size must be positive");
  }
  dispatch_cb_ = dispatcher_.createSchedulableCallback([this]() {
    dispatchNext();
  });
  abandon_cb_ = dispatcher_.createSchedulableCallback([this]() {
    onExchangeAbandoned();
  });
}

ConnectionPipeline::~ConnectionPipeline() {
  close();
  *alive_ = false;
}

void ConnectionPipeline::start() {
  if (state_ == PipelineState::Closed || transport_) {
    return;
  }
  openTransport();
}

void ConnectionPipeline::enqueue(RequestSharedPtr request) {
  if (state_ == PipelineState::Closed) {
    // Reported from the loop, never from inside submit
    dispatcher_.post([request]() { request->error(connectionClosedError()); });
    return;
  }

  CONDUIT_LOG_WITH_CONTEXT(
      Debug, toLogContext(request->trace(), options_.connection_id),
      "queued {} {} ({} ahead)", request->method(), request->path(),
      queue_.size() + running());
  queue_.push_back(std::move(request));
  if (!current_ && state_ != PipelineState::Connecting) {
    scheduleDispatch();
  }
}

void ConnectionPipeline::close() {
  if (state_ == PipelineState::Closed) {
    return;
  }
  CONDUIT_LOG(Debug, "[{}] closing with {} queued, {} in flight",
              options_.connection_id, queue_.size(), running());
  state_ = PipelineState::Closed;

  dispatch_cb_->cancel();
  abandon_cb_->cancel();
  releaseTransport();

  RequestSharedPtr request = std::move(current_);
  current_ = nullptr;
  std::deque<RequestSharedPtr> queue;
  queue.swap(queue_);

  if (request) {
    request->setTerminationHook(nullptr);
    request->error(connectionClosedError());
  }
  for (auto& queued : queue) {
    queued->error(connectionClosedError());
  }
}

bool ConnectionPipeline::connected() const {
  return transport_ && transport_->connected();
}

void ConnectionPipeline::openTransport() {
  transport_ = transport_factory_();
  transport_->setCallbacks(*this);
  state_ = PipelineState::Connecting;
  CONDUIT_LOG(Debug, "[{}] connecting to {}", options_.connection_id,
              transport_->hostname());
  transport_->connect();
}

void ConnectionPipeline::releaseTransport() {
  if (transport_) {
    transport_->close();
    // May be running inside one of the transport's own callbacks
    dispatcher_.deferredDelete(std::move(transport_));
    transport_ = nullptr;
  }
  read_buffer_.clear();
  parser_.reset();
}

void ConnectionPipeline::scheduleDispatch() {
  dispatch_cb_->scheduleCallbackNextIteration();
}

void ConnectionPipeline::onTransportConnected() {
  CONDUIT_LOG(Debug, "[{}] connected", options_.connection_id);
  state_ = PipelineState::Ready;
  dispatchNext();
}

void ConnectionPipeline::dispatchNext() {
  if (state_ == PipelineState::Closed || current_) {
    return;
  }

  // Requests that were aborted or timed out while queued are never sent
  while (!queue_.empty() && queue_.front()->errored()) {
    queue_.pop_front();
  }
  if (queue_.empty()) {
    return;
  }

  if (!transport_) {
    openTransport();
    return;
  }
  if (state_ != PipelineState::Ready) {
    return;
  }

  RequestSharedPtr request = std::move(queue_.front());
  queue_.pop_front();

  current_ = request;
  state_ = PipelineState::Busy;
  ++exchange_id_;
  final_headers_seen_ = false;
  parser_.reset();
  parser_.setSkipBody(request->method() == "HEAD");

  request->setTerminationHook([this](const Error&) {
    // Its response can no longer be matched; drop the connection from the
    // loop rather than from inside the request callback
    abandon_cb_->scheduleCallbackNextIteration();
  });

  CONDUIT_LOG_WITH_CONTEXT(
      Debug, toLogContext(request->trace(), options_.connection_id),
      "dispatch {} {}", request->method(), request->path());
  writeRequest(request);
}

void ConnectionPipeline::writeRequest(const RequestSharedPtr& request) {
  http::WireHead head{request->header(), request->contentLength(),
                      request->streaming(), request->body()};
  transport_->write(http::serializeHead(head));

  if (request->streaming()) {
    startBodyStream(request, http::usesChunkedEncoding(head));
  }
}

void ConnectionPipeline::startBodyStream(const RequestSharedPtr& request,
                                         bool chunked) {
  BodyStreamSharedPtr stream = request->bodyStream();
  if (!stream || stream->destroyed()) {
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  uint64_t exchange = exchange_id_;
  stream->start(
      [this, alive, exchange, chunked](const std::string& chunk) {
        if (alive.expired() || exchange != exchange_id_ || !transport_) {
          return;
        }
        transport_->write(chunked ? http::encodeChunk(chunk) : chunk);
      },
      [this, alive, exchange, chunked]() {
        if (alive.expired() || exchange != exchange_id_ || !transport_) {
          return;
        }
        if (chunked) {
          transport_->write(http::kLastChunk);
        }
      });
}

std::function<void()> ConnectionPipeline::makeResumeHook() {
  std::weak_ptr<bool> alive = alive_;
  uint64_t exchange = exchange_id_;
  return [this, alive, exchange]() {
    if (alive.expired() || exchange != exchange_id_ || !current_ ||
        !transport_) {
      return;
    }
    transport_->resumeReading();
  };
}

void ConnectionPipeline::onTransportReadable() { readLoop(); }

void ConnectionPipeline::readLoop() {
  network::Transport* transport = transport_.get();
  while (transport && transport_.get() == transport) {
    auto result = transport->read(read_buffer_, options_.read_chunk_size);
    if (!result.ok()) {
      if (result.wouldBlock()) {
        // Resumed by the next readable edge
        return;
      }
      if (result.error_code() == EINTR) {
        continue;
      }
      onTransportError(socketError(result.error_info->message));
      return;
    }
    if (*result == 0) {
      handleEndOfStream();
      return;
    }
    if (!processReadBuffer()) {
      return;
    }
  }
}

bool ConnectionPipeline::processReadBuffer() {
  while (!read_buffer_.empty()) {
    if (!current_) {
      protocolViolation("response data received with no request in flight");
      return false;
    }

    events_.clear();
    auto result =
        parser_.execute(read_buffer_.data(), read_buffer_.size(), events_);
    if (isSuccess(result)) {
      read_buffer_.erase(0, get<size_t>(result));
    }

    if (!routeEvents()) {
      return false;
    }

    if (isError(result)) {
      CONDUIT_LOG(Warning, "[{}] {}", options_.connection_id,
                  errorOf(result).message);
      failConnection(errorOf(result), connectionClosedError());
      return false;
    }
  }
  return true;
}

bool ConnectionPipeline::routeEvents() {
  uint64_t exchange = exchange_id_;
  for (auto& event : events_) {
    // Request callbacks may have closed the pipeline or ended the exchange
    if (state_ == PipelineState::Closed || !current_ ||
        exchange != exchange_id_) {
      return false;
    }

    if (auto* headers = get_if<http::HeadersComplete>(&event)) {
      if (headers->status_code >= 200) {
        final_headers_seen_ = true;
      }
      RequestSharedPtr request = current_;
      request->headers(headers->status_code,
                       http::foldHeaders(headers->headers), makeResumeHook());
    } else if (auto* chunk = get_if<http::BodyChunk>(&event)) {
      RequestSharedPtr request = current_;
      request->pushBody(chunk->data);
    } else if (auto* done = get_if<http::MessageComplete>(&event)) {
      if (!final_headers_seen_) {
        // Informational response; the final one follows on this exchange
        parser_.reset();
        continue;
      }
      finishExchange(done->keep_alive);
      return state_ != PipelineState::Closed && transport_ != nullptr;
    }
  }
  return state_ != PipelineState::Closed && transport_ != nullptr;
}

void ConnectionPipeline::finishExchange(bool keep_alive) {
  RequestSharedPtr request = std::move(current_);
  current_ = nullptr;
  request->setTerminationHook(nullptr);
  // The whole response was read, so an abort during it needs no teardown
  abandon_cb_->cancel();

  bool reusable = keep_alive && !request->reset();
  parser_.reset();
  state_ = PipelineState::Ready;

  CONDUIT_LOG_WITH_CONTEXT(
      Debug, toLogContext(request->trace(), options_.connection_id),
      "complete {} {} (reuse={})", request->method(), request->path(),
      reusable);

  request->complete();
  if (state_ == PipelineState::Closed) {
    return;
  }

  if (!read_buffer_.empty()) {
    protocolViolation("response data received after the message completed");
    return;
  }

  if (!reusable) {
    releaseTransport();
  }
  scheduleDispatch();
}

void ConnectionPipeline::handleEndOfStream() {
  CONDUIT_LOG(Debug, "[{}] end of stream", options_.connection_id);

  if (current_ && parser_.messageInProgress()) {
    // Completes a body delimited by connection close
    events_.clear();
    auto result = parser_.finish(events_);
    if (isError(result)) {
      CONDUIT_LOG(Debug, "[{}] response cut short: {}", options_.connection_id,
                  errorOf(result).message);
    }
    if (!routeEvents() && state_ == PipelineState::Closed) {
      return;
    }
  }

  if (current_) {
    failConnection(socketError("other side closed"), connectionClosedError());
    return;
  }

  releaseTransport();
  if (state_ != PipelineState::Closed) {
    state_ = PipelineState::Ready;
    if (!queue_.empty()) {
      scheduleDispatch();
    }
  }
}

void ConnectionPipeline::onTransportError(const Error& error) {
  if (state_ == PipelineState::Closed) {
    return;
  }
  CONDUIT_LOG(Warning, "[{}] transport error: {}", options_.connection_id,
              error.message);

  if (current_) {
    failConnection(error, connectionClosedError());
    return;
  }

  bool connecting = state_ == PipelineState::Connecting;
  releaseTransport();
  state_ = PipelineState::Ready;

  if (connecting) {
    // Everything queued was waiting on this connection attempt
    std::deque<RequestSharedPtr> queue;
    queue.swap(queue_);
    for (auto& queued : queue) {
      queued->error(error);
    }
  } else if (!queue_.empty()) {
    scheduleDispatch();
  }
}

void ConnectionPipeline::onExchangeAbandoned() {
  if (!current_ || !current_->errored()) {
    return;
  }
  CONDUIT_LOG_WITH_CONTEXT(
      Debug, toLogContext(current_->trace(), options_.connection_id),
      "dropping connection for abandoned {} {}", current_->method(),
      current_->path());

  current_->setTerminationHook(nullptr);
  current_ = nullptr;
  releaseTransport();
  state_ = PipelineState::Ready;
  dispatchNext();
}

void ConnectionPipeline::protocolViolation(const std::string& reason) {
  CONDUIT_LOG(Error, "[{}] protocol violation: {}", options_.connection_id,
              reason);
  failConnection(protocolViolationError(reason), connectionClosedError());
}

void ConnectionPipeline::failConnection(const Error& in_flight_error,
                                        const Error& queued_error) {
  abandon_cb_->cancel();
  releaseTransport();

  RequestSharedPtr request = std::move(current_);
  current_ = nullptr;
  std::deque<RequestSharedPtr> queue;
  queue.swap(queue_);
  if (state_ != PipelineState::Closed) {
    state_ = PipelineState::Ready;
  }

  if (request) {
    request->setTerminationHook(nullptr);
    request->error(in_flight_error);
  }
  for (auto& queued : queue) {
    queued->error(queued_error);
  }
  // Callbacks above may have submitted new work
  if (state_ != PipelineState::Closed && !current_ && !queue_.empty()) {
    scheduleDispatch();
  }
}

}  // namespace client
}  // namespace conduit
