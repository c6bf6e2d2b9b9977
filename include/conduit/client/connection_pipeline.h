#ifndef CONDUIT_CLIENT_CONNECTION_PIPELINE_H
#define CONDUIT_CLIENT_CONNECTION_PIPELINE_H

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "conduit/client/request.h"
#include "conduit/event/event_loop.h"
#include "conduit/http/response_parser.h"
#include "conduit/network/transport.h"

namespace conduit {
namespace client {

enum class PipelineState {
  Connecting,  // Transport opening; nothing dispatched
  Ready,       // Slot free; dispatches as soon as a request is queued
  Busy,        // One exchange in flight
  Closed       // close() was called; terminal
};

const char* pipelineStateName(PipelineState state);

/**
 * Runs requests over one HTTP/1.1 connection, one exchange at a time.
 *
 * Requests are dispatched in submission order. The in-flight request lives
 * in a single slot that is set at dispatch and cleared at completion, error
 * or close; response events are routed only to it.
 *
 * A transport failure fails the in-flight request with the transport error
 * and every queued request with ConnectionClosed, then leaves the pipeline
 * Ready without a transport: the next queued request opens a new one.
 * Only close() makes the pipeline Closed.
 */
class ConnectionPipeline : public network::TransportCallbacks {
 public:
  struct Options {
    size_t read_chunk_size{16384};
    // Exchanges allowed in flight; only 1 is supported
    size_t max_in_flight{1};
    std::string connection_id;
  };

  ConnectionPipeline(event::Dispatcher& dispatcher,
                     network::TransportFactory transport_factory,
                     Options options);
  ~ConnectionPipeline() override;

  ConnectionPipeline(const ConnectionPipeline&) = delete;
  ConnectionPipeline& operator=(const ConnectionPipeline&) = delete;

  // Opens the first connection
  void start();

  // Never calls back synchronously
  void enqueue(RequestSharedPtr request);

  // Fails the in-flight and every queued request with ConnectionClosed
  void close();

  PipelineState state() const { return state_; }
  size_t pending() const { return queue_.size(); }
  size_t running() const { return current_ ? 1 : 0; }
  bool connected() const;
  const RequestSharedPtr& current() const { return current_; }
  const std::string& connectionId() const { return options_.connection_id; }

 private:
  // network::TransportCallbacks
  void onTransportConnected() override;
  void onTransportReadable() override;
  void onTransportError(const Error& error) override;

  void openTransport();
  void releaseTransport();
  void scheduleDispatch();
  void dispatchNext();
  void writeRequest(const RequestSharedPtr& request);
  void startBodyStream(const RequestSharedPtr& request, bool chunked);
  std::function<void()> makeResumeHook();

  void readLoop();
  // False once the connection was torn down
  bool processReadBuffer();
  bool routeEvents();
  void finishExchange(bool keep_alive);
  void handleEndOfStream();
  void onExchangeAbandoned();

  void protocolViolation(const std::string& reason);
  void failConnection(const Error& in_flight_error, const Error& queued_error);

  event::Dispatcher& dispatcher_;
  network::TransportFactory transport_factory_;
  Options options_;

  network::TransportPtr transport_;
  PipelineState state_{PipelineState::Ready};

  std::deque<RequestSharedPtr> queue_;
  RequestSharedPtr current_;
  bool final_headers_seen_{false};
  // Bumped per dispatch; stale hooks and stream callbacks compare against it
  uint64_t exchange_id_{0};

  http::ResponseParser parser_;
  std::string read_buffer_;
  std::vector<http::ParseEvent> events_;

  event::SchedulableCallbackPtr dispatch_cb_;
  event::SchedulableCallbackPtr abandon_cb_;

  // Hooks handed out to callers check this before touching the pipeline
  std::shared_ptr<bool> alive_;
};

using ConnectionPipelinePtr = std::unique_ptr<ConnectionPipeline>;

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_CONNECTION_PIPELINE_H
