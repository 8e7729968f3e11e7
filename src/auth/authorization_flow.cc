#define HITL_LOG_COMPONENT "auth"

#include "hitl/auth/authorization_flow.h"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>

#include <openssl/crypto.h>

#include <algorithm>

#include "hitl/auth/pkce.h"
#include "hitl/core/error.h"
#include "hitl/http/url.h"
#include "hitl/logging/log_macros.h"

extern char** environ;

namespace hitl {
namespace auth {

namespace {

bool constantTimeEquals(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// Clears the active listener pointer on every exit path
class ActiveListenerScope {
 public:
  ActiveListenerScope(std::mutex& mutex,
                      CallbackListener*& slot,
                      CallbackListener* listener)
      : mutex_(mutex), slot_(slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = listener;
  }
  ~ActiveListenerScope() {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = nullptr;
  }

 private:
  std::mutex& mutex_;
  CallbackListener*& slot_;
};

}  // namespace

const char* flowStateToString(FlowState state) {
  switch (state) {
    case FlowState::INIT: return "Init";
    case FlowState::AWAITING_CALLBACK: return "AwaitingCallback";
    case FlowState::CODE_RECEIVED: return "CodeReceived";
    case FlowState::EXCHANGING: return "Exchanging";
    case FlowState::COMPLETE: return "Complete";
    case FlowState::FAILED: return "Failed";
  }
  return "Unknown";
}

AuthorizationFlow::AuthorizationFlow(const Context& context,
                                     ClientRegistrar& registrar,
                                     TokenStore& tokens)
    : context_(context),
      registrar_(registrar),
      tokens_(tokens),
      launcher_(&AuthorizationFlow::openInBrowser) {}

bool AuthorizationFlow::openInBrowser(const std::string& url) {
#ifdef __APPLE__
  const char* opener = "open";
#else
  const char* opener = "xdg-open";
#endif
  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null",
                                   O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null",
                                   O_WRONLY, 0);

  std::string program(opener);
  std::string argument(url);
  char* argv[] = {&program[0], &argument[0], nullptr};

  pid_t pid;
  int rc = posix_spawnp(&pid, opener, &actions, nullptr, argv, environ);
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    return false;
  }
  int status = 0;
  if (waitpid(pid, &status, 0) < 0) {
    return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

void AuthorizationFlow::transition(FlowState next) {
  state_.store(next);
  HITL_LOG(Debug, "Authorization flow -> {}", flowStateToString(next));
  if (state_listener_) {
    state_listener_(next);
  }
}

void AuthorizationFlow::cancel() {
  cancelled_.store(true);
  std::lock_guard<std::mutex> lock(listener_mutex_);
  if (active_listener_) {
    active_listener_->cancel();
  }
}

std::string AuthorizationFlow::buildAuthorizationUrl(
    const ClientRegistration& registration,
    const PkceSession& session) const {
  return http::buildUrl(context_.config.endpoint("/api/v1/oauth/authorize"),
                        {{"response_type", "code"},
                         {"client_id", registration.client_id},
                         {"redirect_uri", session.redirect_uri},
                         {"scope", joinScopes(context_.config.scopes)},
                         {"state", session.state},
                         {"code_challenge", session.code_challenge},
                         {"code_challenge_method", "S256"}});
}

TokenSet AuthorizationFlow::run(const std::string& agent_name) {
  bool reused = false;
  try {
    return runOnce(agent_name, &reused);
  } catch (const HitlError& e) {
    if (!reused || !e.isInvalidClient() ||
        e.code() != ErrorCode::AUTHORIZATION_DENIED) {
      throw;
    }
    HITL_LOG(Warning,
             "Cached client registration was rejected ({}), registering a "
             "new client",
             e.oauthError());
  }
  registrar_.invalidate();
  return runOnce(agent_name, &reused);
}

TokenSet AuthorizationFlow::runOnce(const std::string& agent_name,
                                    bool* reused_registration) {
  *reused_registration = false;
  transition(FlowState::INIT);

  try {
    CallbackListener::Options options;
    options.host = context_.config.callback_host;
    options.port = context_.config.callback_port;
    options.path = context_.config.callback_path;
    CallbackListener listener(options);
    ActiveListenerScope scope(listener_mutex_, active_listener_, &listener);
    if (cancelled_.load()) {
      listener.cancel();
    }

    ClientRegistration registration = registrar_.registerClient(
        agent_name, listener.redirectUri(), reused_registration);

    PkceSession session = createPkceSession(
        listener.redirectUri(), context_.now(), context_.config.callback_timeout);
    if (!verifyCodeChallenge(session.code_verifier, session.code_challenge)) {
      throw HitlError(ErrorCode::ENCRYPTION_ERROR,
                      "PKCE challenge does not match its verifier");
    }

    std::string url = buildAuthorizationUrl(registration, session);
    HITL_LOG(Info, "Open this URL to authorize agent '{}': {}", agent_name,
             url);
    if (!launcher_ || !launcher_(url)) {
      HITL_LOG(Warning, "Could not open a browser; open the URL manually");
    }

    transition(FlowState::AWAITING_CALLBACK);
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        session.expires_at - context_.now());
    auto result = listener.waitForRedirect(
        std::max(remaining, std::chrono::milliseconds(0)));
    if (!result) {
      if (listener.cancelled()) {
        throw HitlError(ErrorCode::CANCELLED, "Login cancelled");
      }
      throw HitlError(ErrorCode::AUTHORIZATION_TIMEOUT,
                      "Timed out waiting for the authorization redirect");
    }

    if (result->isError()) {
      std::string message = "Authorization denied: " + result->error;
      if (!result->error_description.empty()) {
        message += " (" + result->error_description + ")";
      }
      throw HitlError(ErrorCode::AUTHORIZATION_DENIED, message, result->error);
    }

    transition(FlowState::CODE_RECEIVED);
    if (session.isExpired(context_.now())) {
      throw HitlError(ErrorCode::AUTHORIZATION_TIMEOUT,
                      "Authorization session expired");
    }
    if (!constantTimeEquals(result->state, session.state)) {
      throw HitlError(ErrorCode::STATE_MISMATCH,
                      "Callback state does not match the issued state");
    }

    transition(FlowState::EXCHANGING);
    TokenSet token =
        exchangeCode(registration, session, result->code, agent_name);
    tokens_.save(token);

    transition(FlowState::COMPLETE);
    HITL_LOG(Info, "Login complete for agent '{}'", agent_name);
    return token;
  } catch (const HitlError& e) {
    HITL_LOG(Error, "Authorization failed: {} ({})", e.what(),
             errorCodeToString(e.code()));
    transition(FlowState::FAILED);
    throw;
  }
}

TokenSet AuthorizationFlow::exchangeCode(const ClientRegistration& registration,
                                         const PkceSession& session,
                                         const std::string& code,
                                         const std::string& agent_name) {
  http::Params form{{"grant_type", "authorization_code"},
                    {"code", code},
                    {"redirect_uri", session.redirect_uri},
                    {"client_id", registration.client_id},
                    {"code_verifier", session.code_verifier}};
  if (registration.client_secret) {
    form.emplace_back("client_secret", *registration.client_secret);
  }

  http::HttpRequest request;
  request.url = context_.config.endpoint("/api/v1/oauth/token");
  request.method = http::HttpMethod::POST;
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";
  request.headers["X-MCP-Agent-Name"] = agent_name;
  request.body = http::formEncode(form);
  request.timeout = context_.config.request_timeout;
  // An authorization code is single use
  request.idempotent = false;

  http::HttpResponse response;
  try {
    response = context_.http->request(request);
  } catch (const HitlError& e) {
    if (e.code() == ErrorCode::CANCELLED) {
      throw;
    }
    throw HitlError(ErrorCode::TOKEN_EXCHANGE_ERROR,
                    std::string("Token exchange failed: ") + e.what());
  }

  if (!response.isSuccess()) {
    auto oauth_error = parseOAuthError(response.body);
    if (oauth_error.error == "invalid_client" ||
        oauth_error.error == "unauthorized_client") {
      registrar_.invalidate();
    }
    std::string message = "Token exchange failed: HTTP " +
                          std::to_string(response.status_code);
    if (!oauth_error.error.empty()) {
      message += " (" + oauth_error.error + ")";
    }
    throw HitlError(ErrorCode::TOKEN_EXCHANGE_ERROR, message,
                    oauth_error.error);
  }

  try {
    return TokenSet::fromTokenResponse(nlohmann::json::parse(response.body),
                                       context_.now(),
                                       context_.config.default_token_lifetime,
                                       agent_name);
  } catch (const nlohmann::json::exception& e) {
    throw HitlError(ErrorCode::TOKEN_EXCHANGE_ERROR,
                    std::string("Malformed token response: ") + e.what());
  } catch (const std::logic_error& e) {
    throw HitlError(ErrorCode::TOKEN_EXCHANGE_ERROR,
                    std::string("Malformed token response: ") + e.what());
  }
}

}  // namespace auth
}  // namespace hitl
