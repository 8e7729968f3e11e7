#define HITL_LOG_COMPONENT "proxy"

#include "hitl/proxy/relay_client.h"

#include "hitl/core/error.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace proxy {

namespace {

void flushEvent(std::string& data, std::vector<nlohmann::json>& out) {
  if (data.empty()) {
    return;
  }
  auto message = nlohmann::json::parse(data, nullptr, false);
  if (!message.is_discarded()) {
    out.push_back(std::move(message));
  } else {
    HITL_LOG(Debug, "Skipping non-JSON event data");
  }
  data.clear();
}

bool isResponse(const nlohmann::json& message) {
  return message.is_object() &&
         (message.contains("result") || message.contains("error"));
}

}  // namespace

RelayClient::RelayClient(const Context& context,
                         std::string relay_url,
                         std::string agent_name)
    : context_(context),
      relay_url_(std::move(relay_url)),
      agent_name_(std::move(agent_name)) {}

std::string RelayClient::sessionId() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_id_;
}

std::vector<nlohmann::json> RelayClient::parseEventStream(
    const std::string& body) {
  std::vector<nlohmann::json> messages;
  std::string data;
  size_t pos = 0;
  while (pos <= body.size()) {
    size_t end = body.find('\n', pos);
    if (end == std::string::npos) {
      end = body.size();
    }
    std::string line = body.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      flushEvent(data, messages);
    } else if (line.compare(0, 5, "data:") == 0) {
      std::string value = line.substr(5);
      if (!value.empty() && value[0] == ' ') {
        value.erase(0, 1);
      }
      if (!data.empty()) {
        data += '\n';
      }
      data += value;
    }
    // event:, id:, retry: and comments carry nothing the proxy needs
    pos = end + 1;
  }
  flushEvent(data, messages);
  return messages;
}

optional<nlohmann::json> RelayClient::send(
    const nlohmann::json& message,
    const http::Authorization& authorization,
    bool idempotent) {
  http::HttpRequest request;
  request.url = relay_url_;
  request.method = http::HttpMethod::POST;
  request.headers["Content-Type"] = "application/json";
  request.headers["Accept"] = "application/json, text/event-stream";
  authorization.applyTo(request);
  if (!agent_name_.empty()) {
    request.headers["X-MCP-Agent-Name"] = agent_name_;
  }
  std::string session = sessionId();
  if (!session.empty()) {
    request.headers["Mcp-Session-Id"] = session;
  }
  request.body = message.dump();
  request.timeout = context_.config.relay_call_timeout;
  request.idempotent = idempotent;

  http::HttpResponse response = context_.http->request(request);

  std::string new_session = response.header("Mcp-Session-Id");
  if (!new_session.empty()) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ != new_session) {
      HITL_LOG(Debug, "Relay session {}", new_session);
      session_id_ = new_session;
    }
  }

  if (response.status_code == 401) {
    throw HitlError(ErrorCode::REAUTHENTICATION_REQUIRED,
                    "Relay rejected the credentials");
  }
  if (response.status_code == 404 && !session.empty()) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ == session) {
      session_id_.clear();
    }
  }

  std::vector<nlohmann::json> messages;
  std::string content_type = response.header("Content-Type");
  if (content_type.find("text/event-stream") != std::string::npos) {
    messages = parseEventStream(response.body);
  } else if (!response.body.empty()) {
    auto parsed = nlohmann::json::parse(response.body, nullptr, false);
    if (parsed.is_array()) {
      for (auto& item : parsed) {
        messages.push_back(std::move(item));
      }
    } else if (!parsed.is_discarded()) {
      messages.push_back(std::move(parsed));
    }
  }

  if (!response.isSuccess()) {
    // A JSON-RPC error body is relayed; anything else is a transport failure
    for (const auto& m : messages) {
      if (m.is_object() && m.contains("error")) {
        return m;
      }
    }
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    "Relay returned HTTP " +
                        std::to_string(response.status_code));
  }

  if (messages.empty()) {
    return nullopt;
  }

  if (message.contains("id")) {
    for (const auto& m : messages) {
      if (isResponse(m) && m.contains("id") && m["id"] == message["id"]) {
        return m;
      }
    }
  }
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    if (isResponse(*it)) {
      return *it;
    }
  }
  return nullopt;
}

}  // namespace proxy
}  // namespace hitl
