#ifndef CONDUIT_NETWORK_TRANSPORT_H
#define CONDUIT_NETWORK_TRANSPORT_H

#include <functional>
#include <memory>
#include <string>

#include "conduit/core/io_result.h"
#include "conduit/core/result.h"
#include "conduit/event/event_loop.h"

namespace conduit {
namespace network {

/**
 * Transport callbacks, invoked on the dispatcher thread.
 */
class TransportCallbacks {
 public:
  virtual ~TransportCallbacks() = default;

  virtual void onTransportConnected() = 0;

  /**
   * Bytes may be available. Edge triggered: the consumer reads until the
   * transport would block.
   */
  virtual void onTransportReadable() = 0;

  /**
   * Connect or write failure. Not raised for close() or for end of stream,
   * which read() reports as a zero-byte result.
   */
  virtual void onTransportError(const Error& error) = 0;
};

/**
 * Byte-stream connection owned by exactly one consumer.
 */
class Transport : public event::DeferredDeletable {
 public:
  ~Transport() override = default;

  virtual void setCallbacks(TransportCallbacks& callbacks) = 0;

  // Starts connecting; completion is reported through the callbacks
  virtual void connect() = 0;

  /**
   * Append up to |max_length| bytes to |buffer|.
   * @return bytes read, 0 at end of stream, or an error (wouldBlock() when
   * nothing is available yet)
   */
  virtual IoCallResult read(std::string& buffer, size_t max_length) = 0;

  /**
   * Queue bytes for sending. Unsent bytes are buffered and flushed when the
   * socket becomes writable; failures surface through onTransportError.
   */
  virtual void write(const std::string& data) = 0;

  // Raise onTransportReadable again on the next loop iteration
  virtual void resumeReading() = 0;

  // Close without raising callbacks
  virtual void close() = 0;

  virtual bool isOpen() const = 0;
  virtual bool connected() const = 0;

  virtual const std::string& hostname() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

// Creates a fresh, unconnected transport to the same origin
using TransportFactory = std::function<TransportPtr()>;

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_TRANSPORT_H
