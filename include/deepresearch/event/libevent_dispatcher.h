#ifndef DEEPRESEARCH_EVENT_LIBEVENT_DISPATCHER_H
#define DEEPRESEARCH_EVENT_LIBEVENT_DISPATCHER_H

#include <atomic>
#include <mutex>
#include <queue>
#include <thread>

#include "deepresearch/event/event_loop.h"

struct event_base;
struct event;

namespace deepresearch {
namespace event {

using libevent_event = struct event;

/**
 * @brief Libevent-based implementation of the Dispatcher interface
 *
 * The event base is created with the epoll backend excluded: epoll rejects
 * regular files, and stdin may be a file redirected into the process.
 */
class LibeventDispatcher : public Dispatcher {
 public:
  explicit LibeventDispatcher(const std::string& name);
  ~LibeventDispatcher() override;

  const std::string& name() override { return name_; }
  std::string backend() const override;

  void post(PostCb callback) override;
  bool isThreadSafe() const override;

  FileEventPtr createFileEvent(int fd,
                               FileReadyCb cb,
                               uint32_t events) override;
  TimerPtr createTimer(TimerCb cb) override;
  SignalEventPtr listenForSignal(int signal_num, SignalCb cb) override;

  void exit() override;
  void run(RunType type) override;

  event_base* base() { return base_; }

 private:
  class FileEventImpl : public FileEvent {
   public:
    FileEventImpl(LibeventDispatcher& dispatcher,
                  int fd,
                  FileReadyCb cb,
                  uint32_t events);
    ~FileEventImpl() override;

    void setEnabled(uint32_t events) override;

   private:
    static void eventCallback(int fd, short events, void* arg);

    LibeventDispatcher& dispatcher_;
    int fd_;
    FileReadyCb cb_;
    libevent_event* event_{nullptr};
    uint32_t enabled_events_{0};
    bool event_added_{false};
  };

  class TimerImpl : public Timer {
   public:
    TimerImpl(LibeventDispatcher& dispatcher, TimerCb cb);
    ~TimerImpl() override;

    void disableTimer() override;
    void enableTimer(std::chrono::milliseconds duration) override;
    bool enabled() override;

   private:
    static void timerCallback(int fd, short events, void* arg);

    TimerCb cb_;
    libevent_event* event_;
    bool enabled_{false};
  };

  class SignalEventImpl : public SignalEvent {
   public:
    SignalEventImpl(LibeventDispatcher& dispatcher, int signal_num, SignalCb cb);
    ~SignalEventImpl() override;

   private:
    static void signalCallback(int fd, short events, void* arg);

    SignalCb cb_;
    libevent_event* event_;
  };

  void initializeLibevent();
  void runPostCallbacks();
  static void postWakeupCallback(int fd, short events, void* arg);

  const std::string name_;
  event_base* base_{nullptr};
  std::thread::id thread_id_;
  std::atomic<bool> exit_requested_{false};

  std::mutex post_mutex_;
  std::queue<PostCb> post_callbacks_;
  int wakeup_fd_[2]{-1, -1};  // Pipe for waking up the event loop
  libevent_event* wakeup_event_{nullptr};
};

}  // namespace event
}  // namespace deepresearch

#endif  // DEEPRESEARCH_EVENT_LIBEVENT_DISPATCHER_H
