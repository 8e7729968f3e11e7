#ifndef HITL_AUTH_AUTHORIZATION_FLOW_H
#define HITL_AUTH_AUTHORIZATION_FLOW_H

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "hitl/auth/auth_types.h"
#include "hitl/auth/callback_listener.h"
#include "hitl/auth/client_registrar.h"
#include "hitl/auth/token_store.h"
#include "hitl/context.h"

/**
 * @file authorization_flow.h
 * @brief OAuth 2.1 authorization-code + PKCE login
 *
 * Init -> AwaitingCallback -> CodeReceived -> Exchanging -> Complete | Failed
 */

namespace hitl {
namespace auth {

enum class FlowState {
  INIT,
  AWAITING_CALLBACK,
  CODE_RECEIVED,
  EXCHANGING,
  COMPLETE,
  FAILED
};

const char* flowStateToString(FlowState state);

class AuthorizationFlow {
 public:
  // Returns false when the browser could not be started
  using BrowserLauncher = std::function<bool(const std::string& url)>;
  using StateListener = std::function<void(FlowState)>;

  AuthorizationFlow(const Context& context,
                    ClientRegistrar& registrar,
                    TokenStore& tokens);

  void setBrowserLauncher(BrowserLauncher launcher) {
    launcher_ = std::move(launcher);
  }
  void setStateListener(StateListener listener) {
    state_listener_ = std::move(listener);
  }

  /**
   * @brief Run one login to completion
   *
   * A reused registration rejected with invalid_client is discarded and the
   * flow restarts once with a fresh one.
   * @return the token set, already saved in the TokenStore
   */
  TokenSet run(const std::string& agent_name);

  // Aborts a pending callback wait from another thread
  void cancel();

  FlowState state() const { return state_.load(); }

  // xdg-open on Linux, open on macOS
  static bool openInBrowser(const std::string& url);

  std::string buildAuthorizationUrl(const ClientRegistration& registration,
                                    const PkceSession& session) const;

 private:
  TokenSet runOnce(const std::string& agent_name, bool* reused_registration);
  TokenSet exchangeCode(const ClientRegistration& registration,
                        const PkceSession& session,
                        const std::string& code,
                        const std::string& agent_name);
  void transition(FlowState next);

  const Context& context_;
  ClientRegistrar& registrar_;
  TokenStore& tokens_;
  BrowserLauncher launcher_;
  StateListener state_listener_;

  std::atomic<FlowState> state_{FlowState::INIT};
  std::atomic<bool> cancelled_{false};
  std::mutex listener_mutex_;
  CallbackListener* active_listener_{nullptr};
};

}  // namespace auth
}  // namespace hitl

#endif  // HITL_AUTH_AUTHORIZATION_FLOW_H
