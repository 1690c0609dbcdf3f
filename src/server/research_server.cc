#define DEEPRESEARCH_LOG_COMPONENT "server"

#include "deepresearch/server/research_server.h"

#include "deepresearch/errors.h"
#include "deepresearch/json/json_serialization.h"
#include "deepresearch/logging/log_macros.h"

namespace deepresearch {
namespace server {

namespace {

constexpr const char* kMethodInitialize = "initialize";
constexpr const char* kMethodPing = "ping";
constexpr const char* kNotificationInitialized = "notifications/initialized";
constexpr const char* kNotificationCancelled = "notifications/cancelled";

// Best-effort id recovery for error responses to malformed requests
jsonrpc::RequestId extractId(const json::JsonValue& message) {
  if (!message.contains("id")) {
    return jsonrpc::RequestId(nullptr);
  }
  try {
    return json::from_json<jsonrpc::RequestId>(message["id"]);
  } catch (const json::JsonException&) {
    return jsonrpc::RequestId(nullptr);
  }
}

}  // namespace

const char* sessionPhaseToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::AwaitingInitialize: return "awaiting-initialize";
    case SessionPhase::Initializing: return "initializing";
    case SessionPhase::Ready: return "ready";
  }
  return "unknown";
}

ResearchServer::ResearchServer(const config::ServerConfig& config,
                               event::Dispatcher& dispatcher,
                               transport::TransportPtr transport)
    : config_(config),
      dispatcher_(dispatcher),
      transport_(std::move(transport)),
      request_dispatcher_(state_) {
  transport_->setDataCallback(
      [this](const std::string& data) { processIncomingData(data); });
  transport_->setConnectionCallback(
      [this](bool connected) { onConnectionEvent(connected); });
}

ResearchServer::~ResearchServer() {
  transport_->stop();
  transport_->setDataCallback(nullptr);
  transport_->setConnectionCallback(nullptr);
}

bool ResearchServer::run() {
  DEEPRESEARCH_LOG(Info, "Starting {} {} on {} transport ({} backend)",
                   config_.server_name, config_.server_version,
                   transport_->transportType(), dispatcher_.backend());

  if (!transport_->start()) {
    DEEPRESEARCH_LOG(Error, "Failed to start {} transport",
                     transport_->transportType());
    return false;
  }

  dispatcher_.run(event::RunType::Block);

  transport_->stop();
  logStats();
  return true;
}

void ResearchServer::shutdown() {
  DEEPRESEARCH_LOG(Info, "Shutdown requested");
  dispatcher_.exit();
}

void ResearchServer::onConnectionEvent(bool connected) {
  if (connected) {
    DEEPRESEARCH_LOG(Debug, "Transport connected");
    return;
  }

  // An unterminated last line is still a frame
  if (!partial_frame_.empty() && !discarding_frame_) {
    std::string frame;
    frame.swap(partial_frame_);
    processFrame(frame);
  }
  partial_frame_.clear();
  discarding_frame_ = false;

  DEEPRESEARCH_LOG(Info, "End of input after {} requests",
                   stats_.requests_total.load());
  dispatcher_.exit();
}

void ResearchServer::processIncomingData(const std::string& data) {
  size_t pos = 0;

  while (pos <= data.size()) {
    auto newline = data.find('\n', pos);

    if (newline == std::string::npos) {
      if (!discarding_frame_) {
        partial_frame_.append(data, pos, std::string::npos);
        if (partial_frame_.size() > config_.max_frame_bytes) {
          partial_frame_.clear();
          discarding_frame_ = true;
          DEEPRESEARCH_LOG(Warning, "Discarding frame longer than {} bytes",
                           config_.max_frame_bytes);
          sendError(jsonrpc::RequestId(nullptr), jsonrpc::PARSE_ERROR,
                    "Frame exceeds " +
                        std::to_string(config_.max_frame_bytes) + " bytes");
        }
      }
      return;
    }

    if (discarding_frame_) {
      // Tail of an oversized frame; already answered
      discarding_frame_ = false;
    } else {
      partial_frame_.append(data, pos, newline - pos);
      std::string frame;
      frame.swap(partial_frame_);

      if (frame.size() > config_.max_frame_bytes) {
        DEEPRESEARCH_LOG(Warning, "Discarding frame of {} bytes", frame.size());
        sendError(jsonrpc::RequestId(nullptr), jsonrpc::PARSE_ERROR,
                  "Frame exceeds " + std::to_string(config_.max_frame_bytes) +
                      " bytes");
      } else {
        processFrame(frame);
      }
    }

    pos = newline + 1;
  }
}

void ResearchServer::processFrame(const std::string& frame) {
  std::string text = frame;
  if (!text.empty() && text.back() == '\r') {
    text.pop_back();
  }
  if (text.find_first_not_of(" \t\r") == std::string::npos) {
    return;
  }

  json::JsonValue message;
  try {
    message = json::JsonValue::parse(text);
  } catch (const json::JsonException& e) {
    DEEPRESEARCH_LOG(Warning, "Unparseable frame: {}", e.what());
    sendError(jsonrpc::RequestId(nullptr), jsonrpc::PARSE_ERROR, e.what());
    return;
  }

  if (!message.isObject()) {
    DEEPRESEARCH_LOG(Warning, "Frame is not a JSON object");
    sendError(jsonrpc::RequestId(nullptr), jsonrpc::INVALID_REQUEST,
              "Invalid request: expected a JSON object");
    return;
  }

  if (!message.contains("method")) {
    if (message.contains("result") || message.contains("error")) {
      DEEPRESEARCH_LOG(Debug, "Ignoring response from client");
      return;
    }
    sendError(extractId(message), jsonrpc::INVALID_REQUEST,
              "Invalid request: missing method");
    return;
  }

  if (!message.contains("id")) {
    try {
      handleNotification(json::from_json<jsonrpc::Notification>(message));
    } catch (const json::JsonException& e) {
      DEEPRESEARCH_LOG(Warning, "Dropping malformed notification: {}",
                       e.what());
    }
    return;
  }

  jsonrpc::Request request;
  try {
    request = json::from_json<jsonrpc::Request>(message);
  } catch (const json::JsonException& e) {
    DEEPRESEARCH_LOG(Warning, "Invalid request: {}", e.what());
    sendError(extractId(message), jsonrpc::INVALID_REQUEST,
              std::string("Invalid request: ") + e.what());
    return;
  }

  sendResponse(handleRequest(request));
}

jsonrpc::Response ResearchServer::handleRequest(
    const jsonrpc::Request& request) {
  stats_.requests_total++;
  const std::string id = jsonrpc::requestIdToString(request.id);
  DEEPRESEARCH_LOG(Debug, "Request {} (id {})", request.method, id);

  try {
    json::JsonValue result;

    if (request.method == kMethodInitialize) {
      result = handleInitialize(request.params);
    } else if (request.method == kMethodPing) {
      result = json::JsonValue::object();
    } else if (config_.require_initialize &&
               phase_ == SessionPhase::AwaitingInitialize) {
      stats_.requests_invalid++;
      DEEPRESEARCH_LOG(Warning, "Rejecting {} (id {}) before initialize",
                       request.method, id);
      return jsonrpc::Response::make_error(
          request.id,
          Error(jsonrpc::INVALID_REQUEST, "Server not initialized"));
    } else if (request_dispatcher_.handles(request.method)) {
      result = request_dispatcher_.dispatch(request.method, request.params);
      if (request.method == kMethodGetPrompt) {
        stats_.prompts_retrieved++;
      } else if (request.method == kMethodReadResource) {
        stats_.resources_served++;
      }
    } else {
      stats_.requests_invalid++;
      DEEPRESEARCH_LOG(Warning, "Method not found: {}", request.method);
      return jsonrpc::Response::make_error(
          request.id, Error(jsonrpc::METHOD_NOT_FOUND,
                            "Method not found: " + request.method));
    }

    stats_.requests_succeeded++;
    return jsonrpc::Response::success(request.id, result);
  } catch (const ResearchError& e) {
    stats_.requests_failed++;
    DEEPRESEARCH_LOG(Warning, "{} (id {}) failed: {}", request.method, id,
                     e.what());
    return jsonrpc::Response::make_error(request.id, e.toError());
  } catch (const json::JsonException& e) {
    stats_.requests_failed++;
    DEEPRESEARCH_LOG(Warning, "{} (id {}) has invalid params: {}",
                     request.method, id, e.what());
    return jsonrpc::Response::make_error(
        request.id, Error(jsonrpc::INVALID_PARAMS,
                          std::string("Invalid params: ") + e.what()));
  } catch (const std::exception& e) {
    stats_.requests_failed++;
    DEEPRESEARCH_LOG(Error, "{} (id {}) raised: {}", request.method, id,
                     e.what());
    return jsonrpc::Response::make_error(
        request.id, Error(jsonrpc::INTERNAL_ERROR, e.what()));
  }
}

json::JsonValue ResearchServer::handleInitialize(
    const optional<Metadata>& params) {
  if (phase_ != SessionPhase::AwaitingInitialize) {
    throw ResearchError(jsonrpc::INVALID_REQUEST,
                        "Server already initialized");
  }

  std::string requested;
  optional<Implementation> client;
  if (params.has_value() && params->isObject()) {
    auto version = (*params)["protocolVersion"];
    if (version.isString()) {
      requested = version.getString();
    } else if (!version.isNull()) {
      throw InvalidParamsError("Invalid 'protocolVersion': expected string");
    }
    if (params->contains("clientInfo")) {
      client = json::from_json<Implementation>((*params)["clientInfo"]);
    }
  }

  negotiated_protocol_ = config_.supportsProtocolVersion(requested)
                             ? requested
                             : config_.protocol_version;
  client_info_ = client;
  phase_ = SessionPhase::Initializing;

  if (client_info_.has_value()) {
    DEEPRESEARCH_LOG(Info, "Initialized by {} {} (protocol {})",
                     client_info_->name, client_info_->version,
                     negotiated_protocol_);
  } else {
    DEEPRESEARCH_LOG(Info, "Initialized (protocol {})", negotiated_protocol_);
  }
  if (!requested.empty() && requested != negotiated_protocol_) {
    DEEPRESEARCH_LOG(Notice, "Client asked for protocol {}, answering {}",
                     requested, negotiated_protocol_);
  }

  return json::to_json(buildInitializeResult(negotiated_protocol_));
}

InitializeResult ResearchServer::buildInitializeResult(
    const std::string& protocol) const {
  CapabilityFlags prompts;
  prompts.listChanged = false;

  CapabilityFlags resources;
  resources.subscribe = false;
  resources.listChanged = false;

  CapabilityFlags tools;
  tools.listChanged = false;

  InitializeResult result;
  result.protocolVersion = protocol;
  result.capabilities.prompts = prompts;
  result.capabilities.resources = resources;
  result.capabilities.tools = tools;
  result.serverInfo = Implementation(config_.server_name,
                                     config_.server_version);
  return result;
}

void ResearchServer::handleNotification(
    const jsonrpc::Notification& notification) {
  stats_.notifications_total++;

  if (notification.method == kNotificationInitialized) {
    if (phase_ == SessionPhase::Initializing) {
      phase_ = SessionPhase::Ready;
      DEEPRESEARCH_LOG(Info, "Session ready");
    } else {
      DEEPRESEARCH_LOG(Warning, "Unexpected {} while {}", notification.method,
                       sessionPhaseToString(phase_));
    }
    return;
  }

  if (notification.method == kNotificationCancelled) {
    // Requests complete before the next frame is read; nothing is in flight
    DEEPRESEARCH_LOG(Debug, "Ignoring cancellation");
    return;
  }

  DEEPRESEARCH_LOG(Debug, "Ignoring notification {}", notification.method);
}

void ResearchServer::sendResponse(const jsonrpc::Response& response) {
  transport_->send(json::to_json(response).toString() + "\n");
}

void ResearchServer::sendError(const jsonrpc::RequestId& id,
                               int code,
                               const std::string& message) {
  stats_.requests_total++;
  stats_.requests_invalid++;
  sendResponse(jsonrpc::Response::make_error(id, Error(code, message)));
}

void ResearchServer::logStats() const {
  DEEPRESEARCH_LOG(
      Info,
      "Processed {} requests ({} succeeded, {} failed, {} invalid), "
      "{} notifications, {} prompts retrieved, {} resources served",
      stats_.requests_total.load(), stats_.requests_succeeded.load(),
      stats_.requests_failed.load(), stats_.requests_invalid.load(),
      stats_.notifications_total.load(), stats_.prompts_retrieved.load(),
      stats_.resources_served.load());
}

}  // namespace server
}  // namespace deepresearch
