#ifndef CONDUIT_CLIENT_SUBSCRIBABLE_H
#define CONDUIT_CLIENT_SUBSCRIBABLE_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace conduit {
namespace client {

/**
 * Handle for an installed event handler. Destroying it removes the
 * handler.
 */
class Subscription {
 public:
  virtual ~Subscription() = default;
};

using SubscriptionPtr = std::unique_ptr<Subscription>;

/**
 * Event source a request can listen on for cancellation.
 */
class Subscribable {
 public:
  using Handler = std::function<void()>;

  virtual ~Subscribable() = default;

  /**
   * Install |handler| for |event|. Handlers fire at most once.
   * @return handle that keeps the handler installed; never null
   */
  virtual SubscriptionPtr subscribe(const std::string& event,
                                    Handler handler) = 0;
};

/**
 * Concrete cancellation signal raising the "abort" event.
 *
 * abort() fires every installed handler once; later calls are no-ops.
 * Handlers installed after the signal fired are never invoked.
 */
class AbortController : public Subscribable {
 public:
  static constexpr const char* kAbortEvent = "abort";

  AbortController();

  SubscriptionPtr subscribe(const std::string& event, Handler handler) override;

  void abort();

  bool aborted() const { return state_->aborted; }

  // Installed handlers not yet fired or removed
  size_t listenerCount() const { return state_->handlers.size(); }

 private:
  struct State {
    std::map<uint64_t, Handler> handlers;
    uint64_t next_id{0};
    bool aborted{false};
  };

  class SubscriptionImpl;

  std::shared_ptr<State> state_;
};

using AbortControllerSharedPtr = std::shared_ptr<AbortController>;

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_SUBSCRIBABLE_H
