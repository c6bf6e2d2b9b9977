#include "conduit/client/client.h"

#include "conduit/network/tcp_transport.h"

#define CONDUIT_LOG_COMPONENT "Client"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace client {

namespace {

RequestTarget targetFor(const config::ClientConfig& config) {
  RequestTarget target;
  target.hostname = config.host;
  target.host_header = config.host;
  if (config.host.find(':') != std::string::npos) {
    target.host_header = "[" + config.host + "]";
  }
  if (config.port != 80) {
    target.host_header += ":" + std::to_string(config.port);
  }
  return target;
}

}  // namespace

Client::Client(event::Dispatcher& dispatcher,
               const config::ClientConfig& config)
    : Client(dispatcher,
             config,
             network::createTcpTransportFactory(dispatcher, config.host,
                                                config.port)) {}

Client::Client(event::Dispatcher& dispatcher,
               const config::ClientConfig& config,
               network::TransportFactory transport_factory)
    : dispatcher_(dispatcher),
      config_(config),
      target_(targetFor(config)) {
  ConnectionPipeline::Options options;
  options.read_chunk_size = config_.read_chunk_size;
  options.max_in_flight = config_.max_in_flight;
  options.connection_id = nextConnectionId();

  pipeline_ = std::make_unique<ConnectionPipeline>(
      dispatcher_, std::move(transport_factory), std::move(options));

  CONDUIT_LOG(Info, "[{}] client for {}", pipeline_->connectionId(),
              target_.host_header);
  pipeline_->start();
}

Client::~Client() {
  // The pipeline fails whatever is still outstanding
  pipeline_.reset();
}

VoidResult Client::submit(RequestDescriptor descriptor,
                          StartCallback callback) {
  TraceContext trace = descriptor.trace;
  auto created = Request::create(dispatcher_, std::move(descriptor),
                                 target_, std::move(callback),
                                 config_.request_timeout);
  if (isError(created)) {
    CONDUIT_LOG_WITH_CONTEXT(
        Debug, toLogContext(trace, pipeline_->connectionId()),
        "rejected request: {}", errorOf(created).message);
    return makeVoidError(errorOf(created));
  }

  pipeline_->enqueue(std::move(get<RequestSharedPtr>(created)));
  return makeVoidSuccess();
}

void Client::close() { pipeline_->close(); }

std::string Client::nextConnectionId() {
  static std::atomic<uint64_t> counter{0};
  return "conn-" + std::to_string(++counter);
}

}  // namespace client
}  // namespace conduit
