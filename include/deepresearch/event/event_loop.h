#ifndef DEEPRESEARCH_EVENT_EVENT_LOOP_H
#define DEEPRESEARCH_EVENT_EVENT_LOOP_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace deepresearch {
namespace event {

class Dispatcher;
class FileEvent;
class Timer;
class SignalEvent;

using DispatcherPtr = std::unique_ptr<Dispatcher>;
using FileEventPtr = std::unique_ptr<FileEvent>;
using TimerPtr = std::unique_ptr<Timer>;
using SignalEventPtr = std::unique_ptr<SignalEvent>;

using PostCb = std::function<void()>;
using FileReadyCb = std::function<void(uint32_t events)>;
using TimerCb = std::function<void()>;
using SignalCb = std::function<void()>;

// File readiness flags passed to FileReadyCb and setEnabled()
enum class FileReadyType : uint32_t {
  Read = 0x01,
  Write = 0x02,
  Closed = 0x04,
  Error = 0x08
};

inline FileReadyType operator|(FileReadyType a, FileReadyType b) {
  return static_cast<FileReadyType>(static_cast<uint32_t>(a) |
                                    static_cast<uint32_t>(b));
}

inline uint32_t operator&(FileReadyType a, uint32_t b) {
  return static_cast<uint32_t>(a) & b;
}

enum class RunType {
  Block,    // Run until exit() is called
  NonBlock  // Process ready events once and return
};

/**
 * Level-triggered readiness watch on a file descriptor.
 * Destroying the object removes the watch; the fd itself is not closed.
 */
class FileEvent {
 public:
  virtual ~FileEvent() = default;

  // Replace the set of watched FileReadyType flags; 0 disables the watch
  virtual void setEnabled(uint32_t events) = 0;
};

class Timer {
 public:
  virtual ~Timer() = default;

  virtual void disableTimer() = 0;
  virtual void enableTimer(std::chrono::milliseconds duration) = 0;
  virtual bool enabled() = 0;
};

// Signal handler registration; the handler is removed on destruction
class SignalEvent {
 public:
  virtual ~SignalEvent() = default;
};

/**
 * Single-threaded event loop.
 *
 * All callbacks run on the thread that called run(). post() is the only
 * method that may be called from another thread.
 */
class Dispatcher {
 public:
  virtual ~Dispatcher() = default;

  virtual const std::string& name() = 0;

  // Name of the I/O multiplexing backend in use (poll, select, ...)
  virtual std::string backend() const = 0;

  virtual void post(PostCb callback) = 0;

  virtual bool isThreadSafe() const = 0;

  virtual FileEventPtr createFileEvent(int fd,
                                       FileReadyCb cb,
                                       uint32_t events) = 0;

  virtual TimerPtr createTimer(TimerCb cb) = 0;

  virtual SignalEventPtr listenForSignal(int signal_num, SignalCb cb) = 0;

  // Stop run() after the current callback returns
  virtual void exit() = 0;

  virtual void run(RunType type) = 0;
};

}  // namespace event
}  // namespace deepresearch

#endif  // DEEPRESEARCH_EVENT_EVENT_LOOP_H
