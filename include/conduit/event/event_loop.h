#ifndef CONDUIT_EVENT_EVENT_LOOP_H
#define CONDUIT_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace conduit {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SchedulableCallback;
class DeferredDeletable;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SchedulableCallbackPtr = std::unique_ptr<SchedulableCallback>;
using DeferredDeletablePtr = std::unique_ptr<DeferredDeletable>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;

// Readiness bits reported to a FileReadyCb
enum class FileReadyType : uint32_t { Read = 0x01, Write = 0x02 };

inline FileReadyType operator|(FileReadyType a, FileReadyType b) {
  return static_cast<FileReadyType>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class FileTriggerType {
  Level,
  // Reported once per readiness change; the consumer drains until EAGAIN
  Edge
};

enum class RunType {
  NonBlock,     // Process what is ready, then return
  RunUntilExit  // Keep iterating until exit()
};

/**
 * Base for objects released through Dispatcher::deferredDelete(), which
 * lets a transport be dropped from inside its own callback.
 */
class DeferredDeletable {
 public:
  virtual ~DeferredDeletable() = default;
};

class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Raise the callback on the next iteration without waiting for the fd.
  // Used to resume reading data the kernel already holds.
  virtual void activate(uint32_t events) = 0;

  // Replace the watched readiness bits; 0 stops watching
  virtual void setEnabled(uint32_t events) = 0;
};

// One-shot timer; re-arming an armed timer restarts it
class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

class SchedulableCallback {
 public:
  virtual ~SchedulableCallback() = default;

  // Inline when called on the loop thread, otherwise next iteration
  virtual void scheduleCallbackCurrentIteration() = 0;

  // Never inline. Repeated calls before it runs collapse into one.
  virtual void scheduleCallbackNextIteration() = 0;

  virtual void cancel() = 0;

  virtual bool enabled() = 0;
};

/**
 * Single-threaded event loop.
 *
 * Connections, requests and their timers belong to the thread that runs
 * the dispatcher and must only be touched from it. post() is the only
 * entry point safe from other threads.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  // Queue |callback| for the loop thread. Never runs inline.
  virtual void post(PostCb callback) = 0;

  // True on the thread that last called run()
  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       FileTriggerType trigger,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SchedulableCallbackPtr createSchedulableCallback(
      std::function<void()> cb) = 0;

  // Destroy |to_delete| on a later iteration
  virtual void deferredDelete(DeferredDeletablePtr&& to_delete) = 0;

  virtual void exit() = 0;

  virtual void run(RunType type) = 0;

  // Drops pending posts and destroys deferred items now
  virtual void shutdown() = 0;
};

class DispatcherFactory {
 public:
  virtual ~DispatcherFactory() = default;

  virtual DispatcherPtr createDispatcher(const std::string& name) = 0;

  virtual const std::string& backendName() const = 0;
};

using DispatcherFactoryPtr = std::unique_ptr<DispatcherFactory>;

DispatcherFactoryPtr createLibeventDispatcherFactory();

}  // namespace event
}  // namespace conduit

#endif  // CONDUIT_EVENT_EVENT_LOOP_H
