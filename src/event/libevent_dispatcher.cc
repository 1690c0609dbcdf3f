#define DEEPRESEARCH_LOG_COMPONENT "event"

#include "deepresearch/event/libevent_dispatcher.h"

#include <unistd.h>

#include <stdexcept>
#include <string>

#include <event2/event.h>
#include <event2/util.h>

#include "deepresearch/logging/log_macros.h"

namespace deepresearch {
namespace event {

namespace {

// Watches are always level-triggered and persistent
short toLibeventEvents(uint32_t events) {
  short result = EV_PERSIST;
  if (events & static_cast<uint32_t>(FileReadyType::Read)) {
    result |= EV_READ;
  }
  if (events & static_cast<uint32_t>(FileReadyType::Write)) {
    result |= EV_WRITE;
  }
  return result;
}

uint32_t fromLibeventEvents(short events) {
  uint32_t result = 0;
  if (events & EV_READ) {
    result |= static_cast<uint32_t>(FileReadyType::Read);
  }
  if (events & EV_WRITE) {
    result |= static_cast<uint32_t>(FileReadyType::Write);
  }
  if (events & EV_TIMEOUT) {
    result |= static_cast<uint32_t>(FileReadyType::Error);
  }
  return result;
}

}  // namespace

// LibeventDispatcher implementation

LibeventDispatcher::LibeventDispatcher(const std::string& name) : name_(name) {
  initializeLibevent();
}

LibeventDispatcher::~LibeventDispatcher() {
  if (wakeup_event_) {
    event_free(wakeup_event_);
  }
  if (wakeup_fd_[0] >= 0) {
    close(wakeup_fd_[0]);
  }
  if (wakeup_fd_[1] >= 0) {
    close(wakeup_fd_[1]);
  }
  if (base_) {
    event_base_free(base_);
  }
}

void LibeventDispatcher::initializeLibevent() {
  struct event_config* config = event_config_new();
  if (!config) {
    throw std::runtime_error("Failed to create event config");
  }
  // epoll refuses regular files; stdin redirected from a file must still work
  event_config_avoid_method(config, "epoll");
  base_ = event_base_new_with_config(config);
  event_config_free(config);

  if (!base_) {
    throw std::runtime_error("Failed to create event base");
  }

  if (pipe(wakeup_fd_) != 0) {
    throw std::runtime_error("Failed to create wakeup pipe");
  }
  evutil_make_socket_nonblocking(wakeup_fd_[0]);
  evutil_make_socket_nonblocking(wakeup_fd_[1]);
  evutil_make_socket_closeonexec(wakeup_fd_[0]);
  evutil_make_socket_closeonexec(wakeup_fd_[1]);

  wakeup_event_ = event_new(base_, wakeup_fd_[0], EV_READ | EV_PERSIST,
                            &LibeventDispatcher::postWakeupCallback, this);
  if (!wakeup_event_) {
    throw std::runtime_error("Failed to create wakeup event");
  }
  event_add(wakeup_event_, nullptr);

  DEEPRESEARCH_LOG(Debug, "Dispatcher '{}' using backend {}", name_,
                   backend());
}

std::string LibeventDispatcher::backend() const {
  const char* method = event_base_get_method(base_);
  return method ? method : "unknown";
}

void LibeventDispatcher::post(PostCb callback) {
  bool need_wakeup = false;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    need_wakeup = post_callbacks_.empty();
    post_callbacks_.push(std::move(callback));
  }

  if (need_wakeup) {
    char byte = 1;
    ssize_t rc = write(wakeup_fd_[1], &byte, 1);
    (void)rc;  // A full pipe already guarantees a wakeup
  }
}

bool LibeventDispatcher::isThreadSafe() const {
  // Before run() no thread owns the loop yet
  if (thread_id_ == std::thread::id()) {
    return false;
  }
  return std::this_thread::get_id() == thread_id_;
}

FileEventPtr LibeventDispatcher::createFileEvent(int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events) {
  return std::make_unique<FileEventImpl>(*this, fd, std::move(cb), events);
}

TimerPtr LibeventDispatcher::createTimer(TimerCb cb) {
  return std::make_unique<TimerImpl>(*this, std::move(cb));
}

SignalEventPtr LibeventDispatcher::listenForSignal(int signal_num,
                                                   SignalCb cb) {
  return std::make_unique<SignalEventImpl>(*this, signal_num, std::move(cb));
}

void LibeventDispatcher::exit() {
  exit_requested_ = true;

  if (isThreadSafe()) {
    event_base_loopbreak(base_);
  } else {
    // The wakeup callback breaks the loop once it sees the flag
    post([]() {});
  }
}

void LibeventDispatcher::run(RunType type) {
  thread_id_ = std::this_thread::get_id();

  runPostCallbacks();

  if (!exit_requested_) {
    int flags = type == RunType::NonBlock ? EVLOOP_NONBLOCK : 0;
    if (event_base_loop(base_, flags) < 0) {
      exit_requested_ = false;
      throw std::runtime_error("Event loop failed");
    }
    runPostCallbacks();
  }

  exit_requested_ = false;
}

void LibeventDispatcher::postWakeupCallback(int fd,
                                            short /*events*/,
                                            void* arg) {
  auto* dispatcher = static_cast<LibeventDispatcher*>(arg);

  char buffer[256];
  while (read(fd, buffer, sizeof(buffer)) > 0) {
    // Drain
  }

  dispatcher->runPostCallbacks();
}

void LibeventDispatcher::runPostCallbacks() {
  std::queue<PostCb> callbacks;
  {
    std::lock_guard<std::mutex> lock(post_mutex_);
    callbacks.swap(post_callbacks_);
  }

  while (!callbacks.empty()) {
    callbacks.front()();
    callbacks.pop();
  }

  if (exit_requested_) {
    event_base_loopbreak(base_);
  }
}

// FileEventImpl implementation

LibeventDispatcher::FileEventImpl::FileEventImpl(LibeventDispatcher& dispatcher,
                                                 int fd,
                                                 FileReadyCb cb,
                                                 uint32_t events)
    : dispatcher_(dispatcher), fd_(fd), cb_(std::move(cb)) {
  event_ = event_new(dispatcher_.base(), fd_, 0, &FileEventImpl::eventCallback,
                     this);
  if (!event_) {
    throw std::runtime_error("Failed to create file event for fd " +
                             std::to_string(fd_));
  }
  setEnabled(events);
}

LibeventDispatcher::FileEventImpl::~FileEventImpl() {
  if (event_) {
    if (event_added_) {
      event_del(event_);
    }
    event_free(event_);
  }
}

void LibeventDispatcher::FileEventImpl::setEnabled(uint32_t events) {
  if (event_added_ && enabled_events_ == events) {
    return;
  }
  enabled_events_ = events;

  if (event_added_) {
    event_del(event_);
    event_added_ = false;
  }
  if (events == 0) {
    return;
  }

  // Safe from inside our own callback: the event is no longer pending
  event_assign(event_, dispatcher_.base(), fd_, toLibeventEvents(events),
               &FileEventImpl::eventCallback, this);
  if (event_add(event_, nullptr) != 0) {
    throw std::runtime_error("Failed to watch fd " + std::to_string(fd_));
  }
  event_added_ = true;
}

void LibeventDispatcher::FileEventImpl::eventCallback(int /*fd*/,
                                                      short events,
                                                      void* arg) {
  auto* file_event = static_cast<FileEventImpl*>(arg);
  file_event->cb_(fromLibeventEvents(events));
}

// TimerImpl implementation

LibeventDispatcher::TimerImpl::TimerImpl(LibeventDispatcher& dispatcher,
                                         TimerCb cb)
    : cb_(std::move(cb)) {
  event_ = evtimer_new(dispatcher.base(), &TimerImpl::timerCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create timer");
  }
}

LibeventDispatcher::TimerImpl::~TimerImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::TimerImpl::disableTimer() {
  event_del(event_);
  enabled_ = false;
}

void LibeventDispatcher::TimerImpl::enableTimer(
    std::chrono::milliseconds duration) {
  struct timeval tv;
  tv.tv_sec = duration.count() / 1000;
  tv.tv_usec = (duration.count() % 1000) * 1000;
  event_add(event_, &tv);
  enabled_ = true;
}

bool LibeventDispatcher::TimerImpl::enabled() { return enabled_; }

void LibeventDispatcher::TimerImpl::timerCallback(int /*fd*/,
                                                  short /*events*/,
                                                  void* arg) {
  auto* timer = static_cast<TimerImpl*>(arg);
  timer->enabled_ = false;
  timer->cb_();
}

// SignalEventImpl implementation

LibeventDispatcher::SignalEventImpl::SignalEventImpl(
    LibeventDispatcher& dispatcher, int signal_num, SignalCb cb)
    : cb_(std::move(cb)) {
  event_ = evsignal_new(dispatcher.base(), signal_num,
                        &SignalEventImpl::signalCallback, this);
  if (!event_) {
    throw std::runtime_error("Failed to create signal event");
  }
  event_add(event_, nullptr);
}

LibeventDispatcher::SignalEventImpl::~SignalEventImpl() {
  if (event_) {
    event_del(event_);
    event_free(event_);
  }
}

void LibeventDispatcher::SignalEventImpl::signalCallback(int /*fd*/,
                                                         short /*events*/,
                                                         void* arg) {
  auto* signal_event = static_cast<SignalEventImpl*>(arg);
  signal_event->cb_();
}

}  // namespace event
}  // namespace deepresearch
