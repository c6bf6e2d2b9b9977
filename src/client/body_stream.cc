#include "conduit/client/body_stream.h"

namespace conduit {
namespace client {

class PushBodyStream::ObserverHandle : public Subscription {
 public:
  ObserverHandle(std::weak_ptr<ErrorObservers> observers, uint64_t id)
      : observers_(std::move(observers)), id_(id) {}

  ~ObserverHandle() override {
    if (auto observers = observers_.lock()) {
      observers->handlers.erase(id_);
    }
  }

 private:
  std::weak_ptr<ErrorObservers> observers_;
  uint64_t id_;
};

PushBodyStream::PushBodyStream()
    : observers_(std::make_shared<ErrorObservers>()) {}

void PushBodyStream::start(DataCallback on_data, EndCallback on_end) {
  if (started_ || destroyed_) {
    return;
  }
  started_ = true;
  on_data_ = std::move(on_data);
  on_end_ = std::move(on_end);
  drain();
}

SubscriptionPtr PushBodyStream::onError(ErrorCallback handler) {
  uint64_t id = observers_->next_id++;
  observers_->handlers.emplace(id, std::move(handler));
  return std::make_unique<ObserverHandle>(observers_, id);
}

void PushBodyStream::destroy(const Error& error) {
  if (destroyed_) {
    return;
  }
  destroyed_ = true;
  destroy_error_ = error;
  pending_.clear();
  on_data_ = nullptr;
  on_end_ = nullptr;
}

bool PushBodyStream::push(const std::string& chunk) {
  if (ended_ || destroyed_) {
    return false;
  }
  pending_.push_back(chunk);
  drain();
  return true;
}

void PushBodyStream::end() {
  if (ended_ || destroyed_) {
    return;
  }
  ended_ = true;
  drain();
}

void PushBodyStream::fail(const Error& error) {
  if (destroyed_) {
    return;
  }
  // Observers may remove themselves while running
  std::map<uint64_t, ErrorCallback> handlers = observers_->handlers;
  for (auto& entry : handlers) {
    if (observers_->handlers.count(entry.first)) {
      entry.second(error);
    }
  }
  destroy(error);
}

void PushBodyStream::drain() {
  if (!started_ || destroyed_) {
    return;
  }
  while (!pending_.empty() && !destroyed_) {
    std::string chunk = std::move(pending_.front());
    pending_.pop_front();
    if (on_data_) {
      on_data_(chunk);
    }
  }
  if (ended_ && !end_delivered_ && !destroyed_) {
    end_delivered_ = true;
    if (on_end_) {
      on_end_();
    }
  }
}

}  // namespace client
}  // namespace conduit
