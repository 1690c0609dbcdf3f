#ifndef DEEPRESEARCH_TRANSPORT_TRANSPORT_H
#define DEEPRESEARCH_TRANSPORT_TRANSPORT_H

#include <functional>
#include <memory>
#include <string>

namespace deepresearch {
namespace transport {

/**
 * Byte-stream transport carrying protocol frames.
 *
 * A transport knows nothing about framing: received bytes are handed to the
 * data callback as they arrive, and send() writes exactly what it is given.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * Send data through the transport
   */
  virtual void send(const std::string& data) = 0;

  /**
   * Register callback for received data
   */
  using DataCallback = std::function<void(const std::string&)>;
  virtual void setDataCallback(DataCallback callback) = 0;

  /**
   * Register callback for connection events; false means the peer closed
   * the stream or a write failed
   */
  using ConnectionCallback = std::function<void(bool connected)>;
  virtual void setConnectionCallback(ConnectionCallback callback) = 0;

  virtual bool start() = 0;
  virtual void stop() = 0;
  virtual bool isConnected() const = 0;

  virtual std::string transportType() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

}  // namespace transport
}  // namespace deepresearch

#endif  // DEEPRESEARCH_TRANSPORT_TRANSPORT_H
