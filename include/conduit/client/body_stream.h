#ifndef CONDUIT_CLIENT_BODY_STREAM_H
#define CONDUIT_CLIENT_BODY_STREAM_H

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "conduit/client/subscribable.h"
#include "conduit/core/result.h"

namespace conduit {
namespace client {

/**
 * Request body produced incrementally.
 *
 * The pipeline calls start() once the request head has been written and
 * forwards every chunk to the connection. All callbacks run on the
 * dispatcher thread.
 */
class BodyStream {
 public:
  using DataCallback = std::function<void(const std::string& chunk)>;
  using EndCallback = std::function<void()>;
  using ErrorCallback = std::function<void(const Error& error)>;

  virtual ~BodyStream() = default;

  virtual void start(DataCallback on_data, EndCallback on_end) = 0;

  // Observe producer failures; the returned handle keeps the observer
  virtual SubscriptionPtr onError(ErrorCallback handler) = 0;

  // Stop producing. Pending data is discarded and no callback fires again.
  virtual void destroy(const Error& error) = 0;

  virtual bool destroyed() const = 0;
};

using BodyStreamSharedPtr = std::shared_ptr<BodyStream>;

/**
 * BodyStream fed by the caller through push() / end() / fail().
 * Data pushed before start() is buffered.
 */
class PushBodyStream : public BodyStream {
 public:
  PushBodyStream();

  void start(DataCallback on_data, EndCallback on_end) override;
  SubscriptionPtr onError(ErrorCallback handler) override;
  void destroy(const Error& error) override;
  bool destroyed() const override { return destroyed_; }

  // Returns false once the stream ended or was destroyed
  bool push(const std::string& chunk);
  void end();

  // Producer failure: notifies error observers, then destroys the stream
  void fail(const Error& error);

  bool started() const { return started_; }
  bool ended() const { return ended_; }
  const optional<Error>& destroyError() const { return destroy_error_; }

 private:
  struct ErrorObservers {
    std::map<uint64_t, ErrorCallback> handlers;
    uint64_t next_id{0};
  };

  class ObserverHandle;

  void drain();

  DataCallback on_data_;
  EndCallback on_end_;
  std::deque<std::string> pending_;
  std::shared_ptr<ErrorObservers> observers_;
  optional<Error> destroy_error_;
  bool started_{false};
  bool ended_{false};
  bool end_delivered_{false};
  bool destroyed_{false};
};

using PushBodyStreamSharedPtr = std::shared_ptr<PushBodyStream>;

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_BODY_STREAM_H
