/**
 * @file research_server.h
 * @brief Stdio MCP server loop for the deep research capabilities
 */

#ifndef DEEPRESEARCH_SERVER_RESEARCH_SERVER_H
#define DEEPRESEARCH_SERVER_RESEARCH_SERVER_H

#include <atomic>
#include <cstdint>
#include <string>

#include "deepresearch/config/server_config.h"
#include "deepresearch/event/event_loop.h"
#include "deepresearch/research/session_state.h"
#include "deepresearch/server/request_dispatcher.h"
#include "deepresearch/transport/transport.h"
#include "deepresearch/types.h"

namespace deepresearch {
namespace server {

// Handshake progress of the single session
enum class SessionPhase {
  AwaitingInitialize,  // no initialize request yet
  Initializing,        // initialize answered, waiting for the notification
  Ready                // notifications/initialized received
};

const char* sessionPhaseToString(SessionPhase phase);

/**
 * Request counters. Every request lands in exactly one of succeeded,
 * failed or invalid; frames that never became a request count as invalid.
 */
struct ServerStats {
  std::atomic<uint64_t> requests_total{0};
  std::atomic<uint64_t> requests_succeeded{0};
  std::atomic<uint64_t> requests_failed{0};
  std::atomic<uint64_t> requests_invalid{0};
  std::atomic<uint64_t> notifications_total{0};
  std::atomic<uint64_t> prompts_retrieved{0};
  std::atomic<uint64_t> resources_served{0};
};

/**
 * Newline-delimited JSON-RPC loop over a transport.
 *
 * One frame is handled at a time, in arrival order, entirely on the
 * dispatcher thread: decode, route, encode, write, then the next frame.
 * Request-level failures become JSON-RPC error responses and never stop the
 * loop; only end of input or shutdown() does.
 *
 * The server owns the session state and the request dispatcher serving it.
 */
class ResearchServer {
 public:
  ResearchServer(const config::ServerConfig& config,
                 event::Dispatcher& dispatcher,
                 transport::TransportPtr transport);
  ~ResearchServer();

  ResearchServer(const ResearchServer&) = delete;
  ResearchServer& operator=(const ResearchServer&) = delete;

  /**
   * Start the transport and block in the dispatcher until end of input or
   * shutdown(). Returns false if the transport could not be started.
   */
  bool run();

  // Ask run() to return; safe from any thread
  void shutdown();

  // Frame assembly; normally fed by the transport data callback
  void processIncomingData(const std::string& data);

  // Handle one complete frame (without its newline)
  void processFrame(const std::string& frame);

  // Route a decoded request; never throws
  jsonrpc::Response handleRequest(const jsonrpc::Request& request);

  void handleNotification(const jsonrpc::Notification& notification);

  SessionPhase phase() const { return phase_; }
  const ServerStats& stats() const { return stats_; }
  const optional<Implementation>& clientInfo() const { return client_info_; }

  const research::SessionState& sessionState() const { return state_; }

 private:
  json::JsonValue handleInitialize(const optional<Metadata>& params);
  InitializeResult buildInitializeResult(const std::string& protocol) const;

  void onConnectionEvent(bool connected);
  void sendResponse(const jsonrpc::Response& response);
  void sendError(const jsonrpc::RequestId& id, int code,
                 const std::string& message);
  void logStats() const;

  config::ServerConfig config_;
  event::Dispatcher& dispatcher_;
  transport::TransportPtr transport_;

  research::SessionState state_;
  RequestDispatcher request_dispatcher_;

  SessionPhase phase_{SessionPhase::AwaitingInitialize};
  optional<Implementation> client_info_;
  std::string negotiated_protocol_;

  std::string partial_frame_;
  bool discarding_frame_{false};

  ServerStats stats_;
};

}  // namespace server
}  // namespace deepresearch

#endif  // DEEPRESEARCH_SERVER_RESEARCH_SERVER_H
