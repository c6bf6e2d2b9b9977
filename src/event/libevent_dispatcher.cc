#include "conduit/event/libevent_dispatcher.h"

#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <event2/event.h>
#include <event2/thread.h>
#include <event2/util.h>

#define CONDUIT_LOG_COMPONENT "Event"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace event {

namespace {

constexpr uint32_t kRead = static_cast<uint32_t>(FileReadyType::Read);
constexpr uint32_t kWrite = static_cast<uint32_t>(FileReadyType::Write);

short readinessToLibevent(uint32_t events) {
  short what = 0;
  if (events & kRead) {
    what |= EV_READ;
  }
  if (events & kWrite) {
    what |= EV_WRITE;
  }
  return what;
}

uint32_t readinessFromLibevent(short what) {
  uint32_t events = 0;
  if (what & EV_READ) {
    events |= kRead;
  }
  if (what & EV_WRITE) {
    events |= kWrite;
  }
  return events;
}

timeval toTimeval(std::chrono::milliseconds duration) {
  timeval tv;
  tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
  return tv;
}

// evthread_use_pthreads() must run before the first event_base exists
void useLibeventLocking() {
  static std::once_flag once;
  std::call_once(once, []() { evthread_use_pthreads(); });
}

event_base* newEventBase() {
  event_config* config = event_config_new();
  if (!config) {
    return event_base_new();
  }
#ifdef __linux__
  event_config_avoid_method(config, "select");
  event_config_avoid_method(config, "poll");
#endif
  event_config_set_flag(config, EVENT_BASE_FLAG_PRECISE_TIMER);
  event_base* base = event_base_new_with_config(config);
  event_config_free(config);
  return base;
}

}  // namespace

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  useLibeventLocking();

  base_ = newEventBase();
  if (!base_) {
    throw std::runtime_error("event_base allocation failed");
  }
  const char* method = event_base_get_method(base_);
  CONDUIT_LOG(Debug, "dispatcher {} on {}", name_, method ? method : "?");

  openWakeupPipe();
  deferred_release_ = std::make_unique<SchedulableCallbackImpl>(
      *this, [this]() { releaseDeferred(); });
}

LibeventDispatcher::~LibeventDispatcher() {
  shutdown();
  deferred_release_.reset();

  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_read_ >= 0) {
    ::close(wakeup_read_);
  }
  if (wakeup_write_ >= 0) {
    ::close(wakeup_write_);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::openWakeupPipe() {
  int fds[2];
  if (::pipe(fds) != 0) {
    throw std::runtime_error(std::string("wakeup pipe: ") +
                             std::strerror(errno));
  }
  wakeup_read_ = fds[0];
  wakeup_write_ = fds[1];
  evutil_make_socket_nonblocking(wakeup_read_);
  evutil_make_socket_nonblocking(wakeup_write_);

  wakeup_event_ = event_new(base_, wakeup_read_, EV_READ | EV_PERSIST,
                            &LibeventDispatcher::onWakeup, this);
  if (!wakeup_event_ || event_add(wakeup_event_, nullptr) != 0) {
    throw std::runtime_error("wakeup event registration failed");
  }
}

void LibeventDispatcher::post(PostCb callback) {
  bool was_empty;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    was_empty = posted_.empty();
    posted_.push_back(std::move(callback));
  }

  // One byte per batch; the loop thread swaps the whole queue out.
  // Posting from the loop thread also takes this path so the callback
  // never runs inside its caller.
  if (!was_empty) {
    return;
  }
  const char byte = 0;
  if (::write(wakeup_write_, &byte, 1) < 0 && errno != EAGAIN &&
      errno != EWOULDBLOCK) {
    CONDUIT_LOG(Error, "dispatcher {}: wakeup write: {}", name_,
                std::strerror(errno));
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  const std::thread::id owner = loop_thread_.load();
  return owner != std::thread::id() && owner == std::this_thread::get_id();
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events) {
  assert(loop_thread_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), trigger,
                                         events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  assert(loop_thread_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SchedulableCallbackPtr LibeventDispatcher::createSchedulableCallback(
    std::function<void()> cb) {
  assert(loop_thread_.load() == std::thread::id() || isThreadSafe());
  return std::make_unique<SchedulableCallbackImpl>(*this, std::move(cb));
}

void LibeventDispatcher::deferredDelete(DeferredDeletablePtr&& to_delete) {
  deferred_.push_back(std::move(to_delete));
  deferred_release_->scheduleCallbackNextIteration();
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;
  event_base_loopbreak(base_);

  // A loop blocked in another thread only notices the flag once woken
  if (!isThreadSafe()) {
    post([]() {});
  }
}

void LibeventDispatcher::run(RunType type) {
  exit_requested_ = false;
  loop_thread_ = std::this_thread::get_id();

  drainPosted();

  if (type == RunType::NonBlock) {
    event_base_loop(base_, EVLOOP_NONBLOCK);
    return;
  }
  while (!exit_requested_) {
    event_base_loop(base_, EVLOOP_ONCE);
  }
}

void LibeventDispatcher::shutdown() {
  releaseDeferred();

  std::deque<PostCb> dropped;
  std::lock_guard<std::mutex> lock(posted_mutex_);
  dropped.swap(posted_);
}

void LibeventDispatcher::onWakeup(int fd, short /*what*/, void* arg) {
  char sink[64];
  while (::read(fd, sink, sizeof(sink)) > 0) {
  }
  static_cast<LibeventDispatcher*>(arg)->drainPosted();
}

void LibeventDispatcher::drainPosted() {
  std::deque<PostCb> batch;
  {
    std::lock_guard<std::mutex> lock(posted_mutex_);
    batch.swap(posted_);
  }
  // Callbacks posted while this batch runs wait for the next wakeup
  for (PostCb& cb : batch) {
    cb();
  }
}

void LibeventDispatcher::releaseDeferred() {
  // Destructors may defer more objects; those go to the next round
  std::vector<DeferredDeletablePtr> batch;
  batch.swap(deferred_);
}

// FileEventImpl

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 FileTriggerType trigger,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)), trigger_(trigger) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::onReady, this);
  if (!event_) {
    throw std::runtime_error("file event allocation failed");
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (pending_) {
    event_del(event_);
  }
  event_free(event_);
}

void LibeventDispatcher::FileEventImpl::activate(uint32_t events) {
  const short what = readinessToLibevent(events);
  if (what != 0) {
    event_active(event_, what, 0);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  // Re-adding an edge-triggered event makes the kernel report current
  // readiness again, so it is never skipped
  if (trigger_ == FileTriggerType::Level && events == watched_) {
    return;
  }
  watched_ = events;

  if (pending_) {
    event_del(event_);
    pending_ = false;
  }
  if (events == 0) {
    return;
  }

  short what = readinessToLibevent(events) | EV_PERSIST;
  if (trigger_ == FileTriggerType::Edge) {
    what |= EV_ET;
  }
  event_assign(event_, dispatcher_.base(), fd_, what, &FileEventImpl::onReady,
               this);
  if (event_add(event_, nullptr) != 0) {
    CONDUIT_LOG(Error, "event_add failed for fd {}", fd_);
    return;
  }
  pending_ = true;
}

void LibeventDispatcher::FileEventImpl::onReady(int /*fd*/,
                                                short what,
                                                void* arg) {
  auto* self = static_cast<FileEventImpl*>(arg);
  const uint32_t events = readinessFromLibevent(what);
  if (events != 0) {
    // May destroy |self|
    self->cb_(events);
  }
}

// TimerImpl

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher.base(), &TimerImpl::onExpired, this);
  if (!event_) {
    throw std::runtime_error("timer allocation failed");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  event_del(event_);
  event_free(event_);
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  if (armed_) {
    event_del(event_);
    armed_ = false;
  }
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  const timeval tv = toTimeval(duration);
  if (evtimer_add(event_, &tv) != 0) {
    CONDUIT_LOG(Error, "evtimer_add failed");
    return;
  }
  armed_ = true;
}

void LibeventDispatcher::TimerImpl::onExpired(int /*fd*/,
                                              short /*what*/,
                                              void* arg) {
  auto* self = static_cast<TimerImpl*>(arg);
  self->armed_ = false;
  // May destroy |self|
  self->cb_();
}

// SchedulableCallbackImpl

LibeventDispatcher::SchedulableCallbackImpl::SchedulableCallbackImpl(
    LibeventDispatcher& dispatcher, std::function<void()> cb)
    : dispatcher_(dispatcher),
      cb_(std::move(cb)),
      timer_(dispatcher, [this]() { cb_(); }) {}

void LibeventDispatcher::SchedulableCallbackImpl::
    scheduleCallbackCurrentIteration() {
  if (timer_.enabled()) {
    return;
  }
  if (dispatcher_.isThreadSafe()) {
    cb_();
    return;
  }
  scheduleCallbackNextIteration();
}

void LibeventDispatcher::SchedulableCallbackImpl::
    scheduleCallbackNextIteration() {
  // A zero timeout fires on the next pass through the loop
  if (!timer_.enabled()) {
    timer_.enableTimer(std::chrono::milliseconds(0));
  }
}

// LibeventDispatcherFactory

DispatcherPtr LibeventDispatcherFactory::createDispatcher(
    const std::string& name) {
  return std::make_unique<LibeventDispatcher>(name);
}

const std::string& LibeventDispatcherFactory::backendName() const {
  static const std::string kBackend = "libevent";
  return kBackend;
}

DispatcherFactoryPtr createLibeventDispatcherFactory() {
  return std::make_unique<LibeventDispatcherFactory>();
}

}  // namespace event
}  // namespace conduit
