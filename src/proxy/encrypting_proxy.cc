#define HITL_LOG_COMPONENT "proxy"

#include "hitl/proxy/encrypting_proxy.h"

#include "hitl/crypto/envelope.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace proxy {

namespace {

const char kDeviceKeysCacheKey[] = "devices";
const char kE2eeSuffix[] = "_e2ee";

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

// Removes the exchange from the tracker when the call returns
class ExchangeScope {
 public:
  ExchangeScope(ExchangeTracker& tracker, uint64_t id)
      : tracker_(tracker), id_(id) {}
  ~ExchangeScope() { tracker_.close(id_); }

 private:
  ExchangeTracker& tracker_;
  uint64_t id_;
};

nlohmann::json errorResponseFor(const nlohmann::json& id, const HitlError& e) {
  return makeErrorResponse(id, rpc::fromErrorCode(e.code()), e.what(),
                           {{"type", errorCodeToString(e.code())}});
}

nlohmann::json cancelledResponse(const nlohmann::json& id) {
  return makeErrorResponse(id, rpc::CANCELLED, "Request cancelled",
                           {{"type", errorCodeToString(ErrorCode::CANCELLED)}});
}

// The envelope carried in a *_e2ee tool result
std::string extractEnvelope(const nlohmann::json& result) {
  if (!result.is_object() || !result.contains("content") ||
      !result["content"].is_array()) {
    throw HitlError(ErrorCode::DECRYPTION_ERROR,
                    "Invalid encrypted response format");
  }
  for (const auto& item : result["content"]) {
    if (item.is_object() && item.value("type", "") == "text" &&
        item.contains("text") && item["text"].is_string()) {
      return item["text"].get<std::string>();
    }
  }
  throw HitlError(ErrorCode::DECRYPTION_ERROR,
                  "Encrypted response carries no text content");
}

}  // namespace

namespace rpc {

int fromErrorCode(ErrorCode code) {
  switch (code) {
    case ErrorCode::REAUTHENTICATION_REQUIRED:
      return REAUTHENTICATION_REQUIRED;
    case ErrorCode::ENCRYPTION_ERROR:
    case ErrorCode::DECRYPTION_ERROR:
      return ENCRYPTION_FAILURE;
    case ErrorCode::CANCELLED:
      return CANCELLED;
    default:
      return INTERNAL_ERROR;
  }
}

ErrorCode toErrorCode(int code) {
  switch (code) {
    case REAUTHENTICATION_REQUIRED:
      return ErrorCode::REAUTHENTICATION_REQUIRED;
    case ENCRYPTION_FAILURE:
      return ErrorCode::ENCRYPTION_ERROR;
    case CANCELLED:
      return ErrorCode::CANCELLED;
    default:
      return ErrorCode::NETWORK_ERROR;
  }
}

}  // namespace rpc

nlohmann::json makeErrorResponse(const nlohmann::json& id,
                                 int code,
                                 const std::string& message,
                                 const nlohmann::json& data) {
  nlohmann::json error{{"code", code}, {"message", message}};
  if (!data.is_null()) {
    error["data"] = data;
  }
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

EncryptingProxy::EncryptingProxy(
    const Context& context,
    CredentialProvider& credential,
    RelayClient& relay,
    api::BackendClient& backend,
    std::shared_ptr<const crypto::AgentKeyPair> agent_key,
    std::string agent_name)
    : context_(context),
      credential_(credential),
      relay_(relay),
      backend_(backend),
      agent_key_(std::move(agent_key)),
      agent_name_(std::move(agent_name)),
      device_keys_(4, context.config.device_key_ttl) {}

nlohmann::json EncryptingProxy::filterToolList(const nlohmann::json& result) {
  nlohmann::json filtered = result;
  if (!filtered.is_object() || !filtered.contains("tools") ||
      !filtered["tools"].is_array()) {
    return filtered;
  }
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : filtered["tools"]) {
    std::string name =
        tool.is_object() && tool.contains("name") && tool["name"].is_string()
            ? tool["name"].get<std::string>()
            : std::string();
    if (!endsWith(name, kE2eeSuffix)) {
      tools.push_back(tool);
    }
  }
  filtered["tools"] = std::move(tools);
  return filtered;
}

optional<nlohmann::json> EncryptingProxy::handle(const std::string& line) {
  auto message = nlohmann::json::parse(line, nullptr, false);
  if (message.is_discarded()) {
    HITL_LOG(Warning, "Discarding malformed JSON from client");
    return makeErrorResponse(nullptr, rpc::PARSE_ERROR, "Parse error");
  }
  if (!message.is_object()) {
    return makeErrorResponse(nullptr, rpc::INVALID_REQUEST, "Invalid Request");
  }

  nlohmann::json id = message.contains("id") ? message["id"] : nlohmann::json();

  if (!message.contains("method")) {
    if (message.contains("id") &&
        (message.contains("result") || message.contains("error"))) {
      // Client answer to a relay-initiated request
      return passThrough(message);
    }
    return makeErrorResponse(id, rpc::INVALID_REQUEST,
                             "Invalid Request: missing method");
  }
  if (!message["method"].is_string()) {
    return makeErrorResponse(id, rpc::INVALID_REQUEST,
                             "Invalid Request: method must be a string");
  }

  if (shutting_down_.load()) {
    if (message.contains("id")) {
      return cancelledResponse(id);
    }
    return nullopt;
  }

  return dispatch(message);
}

std::string EncryptingProxy::callTool(const std::string& name,
                                      const nlohmann::json& arguments) {
  nlohmann::json message{{"jsonrpc", "2.0"},
                         {"id", "cli"},
                         {"method", "tools/call"},
                         {"params", {{"name", name}, {"arguments", arguments}}}};
  auto reply = handle(message.dump());
  if (!reply) {
    throw HitlError(ErrorCode::CANCELLED, name + " was cancelled");
  }

  if (reply->contains("error")) {
    const auto& error = (*reply)["error"];
    int code = error.contains("code") && error["code"].is_number_integer()
                   ? error["code"].get<int>()
                   : rpc::INTERNAL_ERROR;
    std::string text =
        error.contains("message") && error["message"].is_string()
            ? error["message"].get<std::string>()
            : name + " failed";
    throw HitlError(rpc::toErrorCode(code), text);
  }

  const nlohmann::json result = reply->value("result", nlohmann::json());
  std::string text;
  if (result.is_object() && result.contains("content") &&
      result["content"].is_array()) {
    for (const auto& item : result["content"]) {
      if (item.is_object() && item.value("type", "") == "text" &&
          item.contains("text") && item["text"].is_string()) {
        if (!text.empty()) {
          text += '\n';
        }
        text += item["text"].get<std::string>();
      }
    }
  }
  if (result.is_object() && result.value("isError", false)) {
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    text.empty() ? name + " failed" : text);
  }
  return text;
}

optional<nlohmann::json> EncryptingProxy::dispatch(
    const nlohmann::json& message) {
  const std::string method = message["method"].get<std::string>();

  if (method == "tools/call") {
    const auto& params = message.contains("params") ? message["params"]
                                                    : nlohmann::json::object();
    std::string name = params.is_object() && params.contains("name") &&
                               params["name"].is_string()
                           ? params["name"].get<std::string>()
                           : std::string();
    const config::SensitiveTool* tool =
        context_.config.findSensitiveTool(name);
    if (tool) {
      if (!message.contains("id")) {
        HITL_LOG(Warning, "Dropping {} sent as a notification", name);
        return nullopt;
      }
      return callSensitiveTool(message, *tool);
    }
  }

  return passThrough(message);
}

std::vector<crypto::PublicKey> EncryptingProxy::deviceKeys(
    const http::Authorization& authorization,
    bool force_reload) {
  if (force_reload) {
    device_keys_.remove(kDeviceKeysCacheKey);
  }
  return device_keys_.getOrLoad(kDeviceKeysCacheKey, [&]() {
    return backend_.getDevicePublicKeys(authorization, agent_name_);
  });
}

optional<nlohmann::json> EncryptingProxy::callSensitiveTool(
    const nlohmann::json& message,
    const config::SensitiveTool& tool) {
  const nlohmann::json& client_id = message["id"];
  auto exchange =
      tracker_.open(tool.name, client_id, ExchangeTarget::ENCRYPTED);
  ExchangeScope scope(tracker_, exchange->correlation_id);

  logging::LogContext log_ctx;
  log_ctx.component = logging::Component::Proxy;
  log_ctx.request_id = std::to_string(exchange->correlation_id);
  log_ctx.tool_name = tool.name;

  if (shutting_down_.load()) {
    if (exchange->tryComplete()) {
      return cancelledResponse(client_id);
    }
    return nullopt;
  }

  nlohmann::json reply;
  try {
    // Credential first so an expired login fails before anything is sent
    http::Authorization authorization = credential_.authorization();

    auto keys = deviceKeys(authorization, false);
    if (keys.empty()) {
      throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                      "No device public keys available for encryption");
    }

    const auto& params = message["params"];
    nlohmann::json arguments = params.contains("arguments")
                                   ? params["arguments"]
                                   : nlohmann::json::object();
    exchange->plaintext = arguments.dump();
    std::string envelope =
        crypto::EnvelopeCipher::seal(exchange->plaintext, *agent_key_, keys[0]);

    nlohmann::json request{
        {"jsonrpc", "2.0"},
        {"id", exchange->correlation_id},
        {"method", "tools/call"},
        {"params",
         {{"name", tool.name + kE2eeSuffix},
          {"arguments", {{"encrypted_payload", envelope}}}}}};

    HITL_LOG_WITH_CONTEXT(Debug, log_ctx, "Sending encrypted {}{}", tool.name,
                          kE2eeSuffix);
    auto response = relay_.send(request, authorization, false);
    if (!response) {
      throw HitlError(ErrorCode::NETWORK_ERROR,
                      "Relay returned no response for " + tool.name);
    }
    if (!response->contains("id") ||
        (*response)["id"] != nlohmann::json(exchange->correlation_id)) {
      throw HitlError(ErrorCode::DECRYPTION_ERROR,
                      "Relay response does not belong to this request");
    }

    const nlohmann::json result = response->value("result", nlohmann::json());
    if (response->contains("error")) {
      reply = {{"jsonrpc", "2.0"},
               {"id", client_id},
               {"error", (*response)["error"]}};
    } else if (result.is_object() && result.value("isError", false)) {
      // Tool-level failure reported by the relay carries no envelope
      reply = {{"jsonrpc", "2.0"}, {"id", client_id}, {"result", result}};
    } else {
      std::string text;
      if (tool.reply == config::SensitiveReply::ACKNOWLEDGE) {
        text = tool.acknowledgement;
      } else {
        std::string sealed = extractEnvelope(result);
        crypto::OpenedEnvelope opened;
        try {
          opened = crypto::EnvelopeCipher::openFromAny(sealed, *agent_key_,
                                                       keys);
        } catch (const HitlError&) {
          // A device may have enrolled since the keys were cached
          auto fresh = deviceKeys(authorization, true);
          if (fresh == keys) {
            throw;
          }
          opened = crypto::EnvelopeCipher::openFromAny(sealed, *agent_key_,
                                                       fresh);
        }
        HITL_LOG_WITH_CONTEXT(Debug, log_ctx, "Reply sealed by device {}",
                              crypto::publicKeyToBase64(
                                  opened.sender_public_key));
        text = std::move(opened.plaintext);
      }
      reply = {{"jsonrpc", "2.0"},
               {"id", client_id},
               {"result",
                {{"content",
                  nlohmann::json::array({{{"type", "text"}, {"text", text}}})}}}};
    }
    HITL_LOG_WITH_CONTEXT(Info, log_ctx, "{} completed", tool.name);
  } catch (const HitlError& e) {
    HITL_LOG_WITH_CONTEXT(Error, log_ctx, "{} failed: {} ({})", tool.name,
                          e.what(), errorCodeToString(e.code()));
    reply = errorResponseFor(client_id, e);
  } catch (const nlohmann::json::exception& e) {
    HITL_LOG_WITH_CONTEXT(Error, log_ctx, "{} failed: malformed relay data",
                          tool.name);
    reply = errorResponseFor(
        client_id, HitlError(ErrorCode::DECRYPTION_ERROR,
                             std::string("Malformed relay response: ") +
                                 e.what()));
  }

  if (!exchange->tryComplete()) {
    return nullopt;
  }
  return reply;
}

optional<nlohmann::json> EncryptingProxy::passThrough(
    const nlohmann::json& message) {
  const bool is_request = message.contains("id") && message.contains("method");
  const std::string method =
      is_request ? message["method"].get<std::string>() : std::string();

  std::shared_ptr<ProxyExchange> exchange;
  std::unique_ptr<ExchangeScope> scope;
  if (is_request) {
    exchange =
        tracker_.open(method, message["id"], ExchangeTarget::PLAINTEXT);
    scope.reset(new ExchangeScope(tracker_, exchange->correlation_id));
    if (shutting_down_.load()) {
      if (exchange->tryComplete()) {
        return cancelledResponse(message["id"]);
      }
      return nullopt;
    }
  }

  nlohmann::json reply;
  try {
    auto response = relay_.send(message, credential_.authorization(), false);
    if (!is_request) {
      return nullopt;
    }
    if (!response) {
      throw HitlError(ErrorCode::NETWORK_ERROR,
                      "Relay returned no response for " + method);
    }
    reply = std::move(*response);
    if (method == "tools/list" && reply.contains("result")) {
      reply["result"] = filterToolList(reply["result"]);
    }
  } catch (const HitlError& e) {
    HITL_LOG(Warning, "Forwarding {} failed: {}",
             is_request ? method : std::string("message"), e.what());
    if (!is_request) {
      return nullopt;
    }
    reply = errorResponseFor(message["id"], e);
  }

  if (!exchange->tryComplete()) {
    return nullopt;
  }
  return reply;
}

std::vector<nlohmann::json> EncryptingProxy::shutdown() {
  shutting_down_.store(true);

  std::vector<nlohmann::json> replies;
  for (const auto& exchange : tracker_.drain()) {
    if (exchange->tryComplete()) {
      HITL_LOG(Info, "Cancelling outstanding {} (correlation {})",
               exchange->tool_name, exchange->correlation_id);
      replies.push_back(cancelledResponse(exchange->client_request_id));
    }
  }

  // Unblock workers waiting on the relay and refuse anything started later
  context_.http->close();
  return replies;
}

}  // namespace proxy
}  // namespace hitl
