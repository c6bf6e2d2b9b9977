#ifndef CONDUIT_EVENT_LIBEVENT_DISPATCHER_H
#define CONDUIT_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "conduit/event/event_loop.h"

struct event_base;
struct event;

namespace conduit {
namespace event {

using libevent_event = struct event;

/**
 * Dispatcher backed by a libevent event_base.
 *
 * Cross-thread posts are queued under a mutex and signalled through a
 * self-pipe registered on the base. Timers and next-iteration callbacks
 * are plain libevent timers.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }
  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               FileTriggerType trigger,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  SchedulableCallbackPtr createSchedulableCallback(
      std::function<void()> cb) override;

  void deferredDelete(DeferredDeletablePtr&& to_delete) override;

  void exit() override;
  void run(RunType type) override;
  void shutdown() override;

  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  FileTriggerType trigger,
                  uint32_t events);
    ~FileEventImpl() override;

    void activate(uint32_t events) override;
    void setEnabled(uint32_t events) override;

   private:
    static void onReady(int fd, short what, void* arg);

    LibeventDispatcher& dispatcher_;
    const int fd_;
    FileReadyCb cb_;
    const FileTriggerType trigger_;
    libevent_event* event_{nullptr};
    uint32_t watched_{0};
    bool pending_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override { return armed_; }

   private:
    static void onExpired(int fd, short what, void* arg);

    TimerCb cb_;
    libevent_event* event_{nullptr};
    bool armed_{false};
  };

  class SchedulableCallbackImpl : public SchedulableCallback {
   public:
    SchedulableCallbackImpl(LibeventDispatcher& dispatcher,
                            std::function<void()> cb);

    void scheduleCallbackCurrentIteration() override;
    void scheduleCallbackNextIteration() override;
    void cancel() override { timer_.disableTimer(); }
    bool enabled() override { return timer_.enabled(); }

   private:
    LibeventDispatcher& dispatcher_;
    std::function<void()> cb_;
    TimerImpl timer_;
  };

  void openWakeupPipe();
  void drainPosted();
  void releaseDeferred();
  static void onWakeup(int fd, short what, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::atomic<std::thread::id> loop_thread_{};
  std::atomic<bool> exit_requested_{false};

  std::mutex posted_mutex_;
  std::deque<PostCb> posted_;
  int wakeup_read_{-1};
  int wakeup_write_{-1};
  libevent_event* wakeup_event_{nullptr};

  std::vector<DeferredDeletablePtr> deferred_;
  std::unique_ptr<SchedulableCallbackImpl> deferred_release_;
};

class LibeventDispatcherFactory : public DispatcherFactory {
 public:
  DispatcherPtr createDispatcher(const std::string& name) override;
  const std::string& backendName() const override;
};

}  // namespace event
}  // namespace conduit

#endif  // CONDUIT_EVENT_LIBEVENT_DISPATCHER_H
