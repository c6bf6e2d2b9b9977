#include "conduit/client/subscribable.h"

namespace conduit {
namespace client {

namespace {

// Returned for events a source never raises
class NullSubscription : public Subscription {};

}  // namespace

class AbortController::SubscriptionImpl : public Subscription {
 public:
  SubscriptionImpl(std::weak_ptr<State> state, uint64_t id)
      : state_(std::move(state)), id_(id) {}

  ~SubscriptionImpl() override {
    if (auto state = state_.lock()) {
      state->handlers.erase(id_);
    }
  }

 private:
  std::weak_ptr<State> state_;
  uint64_t id_;
};

AbortController::AbortController() : state_(std::make_shared<State>()) {}

SubscriptionPtr AbortController::subscribe(const std::string& event,
                                           Handler handler) {
  if (event != kAbortEvent || state_->aborted) {
    return std::make_unique<NullSubscription>();
  }
  uint64_t id = state_->next_id++;
  state_->handlers.emplace(id, std::move(handler));
  return std::make_unique<SubscriptionImpl>(state_, id);
}

void AbortController::abort() {
  if (state_->aborted) {
    return;
  }
  state_->aborted = true;

  // Handlers may drop their own subscription while running
  std::map<uint64_t, Handler> handlers;
  handlers.swap(state_->handlers);
  for (auto& entry : handlers) {
    entry.second();
  }
}

}  // namespace client
}  // namespace conduit
