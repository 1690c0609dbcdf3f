/**
 * @file stdio_transport.h
 * @brief Transport over a pair of file descriptors, normally stdin/stdout
 */

#ifndef DEEPRESEARCH_TRANSPORT_STDIO_TRANSPORT_H
#define DEEPRESEARCH_TRANSPORT_STDIO_TRANSPORT_H

#include "deepresearch/event/event_loop.h"
#include "deepresearch/transport/transport.h"

namespace deepresearch {
namespace transport {

/**
 * Stdio transport driven by the dispatcher.
 *
 * Reads happen on a dispatcher file event with the input descriptor in
 * non-blocking mode, so waiting for input never stalls the loop thread.
 * send() writes the whole frame before returning, polling for writability
 * whenever the output would block; frames therefore leave in the order they
 * were sent.
 *
 * End of input is reported through the connection callback. The output side
 * stays usable until stop() or a failed write, so responses to the last
 * frames of a closed input can still be delivered. The descriptors are never
 * closed by the transport.
 */
class StdioTransport : public Transport {
 public:
  explicit StdioTransport(event::Dispatcher& dispatcher,
                          int in_fd = 0,
                          int out_fd = 1);
  ~StdioTransport() override;

  void send(const std::string& data) override;

  void setDataCallback(DataCallback callback) override {
    data_callback_ = std::move(callback);
  }

  void setConnectionCallback(ConnectionCallback callback) override {
    connection_callback_ = std::move(callback);
  }

  bool start() override;
  void stop() override;
  bool isConnected() const override { return input_open_ && output_open_; }

  std::string transportType() const override { return "stdio"; }

 private:
  void onReadReady();
  void closeInput();
  void notifyDisconnected(const std::string& reason);
  bool waitWritable();

  event::Dispatcher& dispatcher_;
  int in_fd_;
  int out_fd_;
  int saved_in_flags_{-1};

  event::FileEventPtr read_event_;
  bool input_open_{false};
  bool output_open_{false};
  bool disconnect_reported_{false};

  DataCallback data_callback_;
  ConnectionCallback connection_callback_;
};

}  // namespace transport
}  // namespace deepresearch

#endif  // DEEPRESEARCH_TRANSPORT_STDIO_TRANSPORT_H
