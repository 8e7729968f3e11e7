/**
 * @file hitl_cli.cc
 * @brief hitl-cli: login, logout, status, the encrypting MCP proxy and
 *        one-shot human-interaction commands
 */

#define HITL_LOG_COMPONENT "cli"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "hitl/api/backend_client.h"
#include "hitl/auth/authorization_flow.h"
#include "hitl/auth/client_registrar.h"
#include "hitl/auth/token_store.h"
#include "hitl/config/config.h"
#include "hitl/context.h"
#include "hitl/crypto/key_manager.h"
#include "hitl/logging/log_macros.h"
#include "hitl/proxy/credential.h"
#include "hitl/proxy/encrypting_proxy.h"
#include "hitl/proxy/proxy_server.h"
#include "hitl/proxy/relay_client.h"
#include "hitl/proxy/stdio_server.h"
#include "hitl/storage/secure_file.h"

using namespace hitl;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitInterrupted = 130;

struct Options {
  std::string command;
  std::string config_file;
  std::string config_dir;
  std::string backend_url;
  std::string log_level;
  std::string agent_name;
  std::string relay_url;
  bool force = false;
  bool all = false;

  // request, notify, notify-completion
  std::string prompt;
  std::vector<std::string> choices;
  std::string placeholder_text;
  std::string message;
  std::string summary;
};

void printUsage(const char* program) {
  fmt::print(stderr,
             "Usage: {} [options] <command> [args]\n"
             "\n"
             "Commands:\n"
             "  login [--name <agent>] [--force]  Authorize this agent\n"
             "  logout [--all]                    Remove stored tokens\n"
             "  status                            Show login and key state\n"
             "  proxy [relay-url]                 Serve MCP on stdio\n"
             "  request --prompt <text> [--choice <c>]... [--placeholder-text <t>]\n"
             "                                    Ask the human and wait\n"
             "  notify --message <text>           Send a notification\n"
             "  notify-completion --summary <text>\n"
             "                                    Report a finished task and wait\n"
             "\n"
             "Options:\n"
             "  --config <file>        YAML configuration file\n"
             "  --config-dir <dir>     Credential directory\n"
             "  --backend-url <url>    Backend base URL\n"
             "  --log-level <level>    debug, info, warning, error, off\n"
             "  -h, --help             Show this help\n",
             program);
}

bool parseArgs(int argc, char* argv[], Options& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string& out) {
      if (i + 1 >= argc) {
        fmt::print(stderr, "Missing value for {}\n", arg);
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      return false;
    } else if (arg == "--config") {
      if (!value(options.config_file)) return false;
    } else if (arg == "--config-dir") {
      if (!value(options.config_dir)) return false;
    } else if (arg == "--backend-url") {
      if (!value(options.backend_url)) return false;
    } else if (arg == "--log-level") {
      if (!value(options.log_level)) return false;
    } else if (arg == "--name") {
      if (!value(options.agent_name)) return false;
    } else if (arg == "--prompt") {
      if (!value(options.prompt)) return false;
    } else if (arg == "--choice") {
      std::string choice;
      if (!value(choice)) return false;
      options.choices.push_back(choice);
    } else if (arg == "--placeholder-text") {
      if (!value(options.placeholder_text)) return false;
    } else if (arg == "--message") {
      if (!value(options.message)) return false;
    } else if (arg == "--summary") {
      if (!value(options.summary)) return false;
    } else if (arg == "--force") {
      options.force = true;
    } else if (arg == "--all") {
      options.all = true;
    } else if (!arg.empty() && arg[0] == '-') {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      return false;
    } else if (options.command.empty()) {
      options.command = arg;
    } else if (options.command == "proxy" && options.relay_url.empty()) {
      options.relay_url = arg;
    } else {
      fmt::print(stderr, "Unexpected argument: {}\n", arg);
      return false;
    }
  }
  return !options.command.empty();
}

config::Config buildConfig(const Options& options) {
  std::string file = options.config_file;
  if (file.empty() && !options.config_dir.empty() &&
      storage::fileExists(options.config_dir + "/config.yaml")) {
    file = options.config_dir + "/config.yaml";
  }

  config::Config config = config::loadConfig(file);
  if (!options.config_dir.empty()) {
    config.config_dir = options.config_dir;
  }
  if (!options.backend_url.empty()) {
    config.backend_url = options.backend_url;
  }
  if (!options.agent_name.empty()) {
    config.agent_name = options.agent_name;
  }
  if (!options.log_level.empty()) {
    config.log_level = config::parseLogLevel(options.log_level);
  }
  config::validate(config);
  return config;
}

/**
 * @brief Delivers SIGINT/SIGTERM to a callback on a dedicated thread
 *
 * The signals are blocked in every thread started after construction, so
 * the callback runs outside signal context and may take locks.
 */
class SignalWatcher {
 public:
  explicit SignalWatcher(std::function<void(int)> on_signal)
      : on_signal_(std::move(on_signal)) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
    sigaddset(&signals_, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
    thread_ = std::thread([this]() { watch(); });
  }

  ~SignalWatcher() {
    pthread_kill(thread_.native_handle(), SIGUSR1);
    thread_.join();
  }

  bool interrupted() const { return interrupted_.load(); }

 private:
  void watch() {
    for (;;) {
      int sig = 0;
      if (sigwait(&signals_, &sig) != 0) {
        return;
      }
      if (sig == SIGUSR1) {
        return;
      }
      HITL_LOG(Info, "Received signal {}", sig);
      interrupted_ = true;
      on_signal_(sig);
    }
  }

  std::function<void(int)> on_signal_;
  sigset_t signals_;
  std::atomic<bool> interrupted_{false};
  std::thread thread_;
};

std::string formatTime(TimePoint when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm_utc;
  gmtime_r(&t, &tm_utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &tm_utc);
  return buffer;
}

// Creates agent.key on first use and registers the public half
std::shared_ptr<const crypto::AgentKeyPair> ensureAgentKey(
    const Context& context,
    const http::Authorization& authorization) {
  crypto::KeyManager keys(context.config.keyFile());
  bool generated = false;
  auto key_pair = keys.ensureKeyPair(&generated);
  if (!generated) {
    return key_pair;
  }

  auto agent_id =
      api::BackendClient::agentIdFromToken(authorization.bearerToken());
  if (!agent_id) {
    HITL_LOG(Warning,
             "Credential carries no agent_id; public key not registered");
    return key_pair;
  }
  try {
    api::BackendClient backend(context);
    backend.registerAgentKey(authorization, *agent_id,
                             key_pair->publicKeyBase64());
    HITL_LOG(Info, "Registered agent public key");
  } catch (const HitlError& e) {
    HITL_LOG(Error, "Failed to register public key with backend: {}",
             e.what());
  }
  return key_pair;
}

int runLogin(const Context& context) {
  auth::ClientRegistrar registrar(context);
  auth::TokenStore store(context, registrar);

  auto existing = store.load();
  if (existing && !store.isExpired(*existing) &&
      existing->agent_name == context.config.agent_name) {
    fmt::print("Already logged in as agent '{}'. Use --force to log in "
               "again.\n",
               existing->agent_name);
    return kExitOk;
  }

  auth::AuthorizationFlow flow(context, registrar, store);
  SignalWatcher watcher([&flow](int) { flow.cancel(); });

  auth::TokenSet token = flow.run(context.config.agent_name);
  fmt::print("Authentication successful for agent '{}'.\n", token.agent_name);

  ensureAgentKey(context, http::Authorization::bearer(token.access_token));
  fmt::print("End-to-end encryption key ready.\n");
  return kExitOk;
}

int runLogout(const Context& context, bool all) {
  auth::ClientRegistrar registrar(context);
  auth::TokenStore store(context, registrar);

  bool had_token = store.load().has_value();
  store.clear();
  storage::removeFile(context.config.legacyTokenFile());
  if (all) {
    registrar.invalidate();
  }

  if (had_token) {
    fmt::print("Logged out.\n");
  } else {
    fmt::print("Not logged in.\n");
  }
  return kExitOk;
}

int runStatus(const Context& context) {
  auth::ClientRegistrar registrar(context);
  auth::TokenStore store(context, registrar);

  fmt::print("Backend:       {}\n", context.config.backend_url);
  fmt::print("Config dir:    {}\n", context.config.config_dir);

  auto registration = registrar.cached();
  if (registration) {
    fmt::print("OAuth client:  {} (agent '{}')\n",
               auth::maskSecret(registration->client_id),
               registration->agent_name);
  } else {
    fmt::print("OAuth client:  not registered\n");
  }

  auto token = store.load();
  if (token) {
    const char* state = store.isExpired(*token)
                            ? (token->refresh_token ? "expired, refreshable"
                                                    : "expired")
                            : "valid";
    fmt::print("Login:         agent '{}', {} until {}\n", token->agent_name,
               state, formatTime(token->expires_at));
  } else if (storage::fileExists(context.config.legacyTokenFile())) {
    fmt::print("Login:         legacy token\n");
  } else {
    fmt::print("Login:         not logged in\n");
  }

  crypto::KeyManager keys(context.config.keyFile());
  auto key_pair = keys.loadKeyPair();
  if (key_pair) {
    fmt::print("Agent key:     {} (created {})\n", key_pair->publicKeyBase64(),
               formatTime(key_pair->createdAt()));
  } else {
    fmt::print("Agent key:     none\n");
  }
  return kExitOk;
}

/**
 * @brief Credential, agent key and encrypting proxy for one invocation
 *
 * Shared by the stdio proxy and the one-shot tool commands so both reach
 * the relay the same way.
 */
class RelaySession {
 public:
  RelaySession(const Context& context, const std::string& relay_url)
      : registrar_(context),
        store_(context, registrar_),
        credential_(proxy::CredentialProvider::resolve(context, store_)),
        relay_(context,
               relay_url.empty() ? context.config.relayUrl() : relay_url,
               context.config.agent_name),
        backend_(context),
        proxy_(context, credential_, relay_, backend_,
               ensureAgentKey(context, credential_.authorization()),
               context.config.agent_name) {
    HITL_LOG(Info, "Using {} credentials, relaying to {}",
             credential_.kindName(), relay_.url());
  }

  proxy::EncryptingProxy& proxy() { return proxy_; }

 private:
  auth::ClientRegistrar registrar_;
  auth::TokenStore store_;
  proxy::CredentialProvider credential_;
  proxy::RelayClient relay_;
  api::BackendClient backend_;
  proxy::EncryptingProxy proxy_;
};

int runProxy(const Context& context, const std::string& relay_url) {
  RelaySession session(context, relay_url);

  proxy::StdioServer io;
  proxy::ProxyServer server(session.proxy(), io,
                            context.config.worker_threads);
  SignalWatcher watcher([&server](int) { server.stop(); });

  server.run();
  return watcher.interrupted() ? kExitInterrupted : kExitOk;
}

// One sensitive tool call; Ctrl-C cancels it
std::string callTool(const Context& context,
                     const std::string& tool,
                     const nlohmann::json& arguments) {
  RelaySession session(context, "");
  SignalWatcher watcher([&session](int) { session.proxy().shutdown(); });
  return session.proxy().callTool(tool, arguments);
}

int runRequest(const Context& context, const Options& options) {
  nlohmann::json arguments{{"prompt", options.prompt},
                           {"choices", options.choices},
                           {"placeholder_text", options.placeholder_text}};
  fmt::print("Sending request: {}\n", options.prompt);
  if (!options.choices.empty()) {
    fmt::print("Choices: {}\n", nlohmann::json(options.choices).dump());
  }
  fmt::print("Waiting for human response...\n");
  std::fflush(stdout);

  std::string response = callTool(context, "request_human_input", arguments);
  fmt::print("Human response received: {}\n", response);
  return kExitOk;
}

int runNotify(const Context& context, const Options& options) {
  std::string response =
      callTool(context, "notify_human", {{"message", options.message}});
  fmt::print("{}\n", response);
  return kExitOk;
}

int runNotifyCompletion(const Context& context, const Options& options) {
  fmt::print("Summary: {}\n", options.summary);
  fmt::print("Waiting for human response...\n");
  std::fflush(stdout);

  std::string response = callTool(context, "notify_human_completion",
                                  {{"summary", options.summary}});
  fmt::print("Human response received: {}\n", response);
  return kExitOk;
}

// Required option of a tool command, or a usage error
bool requireOption(const Options& options,
                   const std::string& value,
                   const char* flag) {
  if (value.empty()) {
    fmt::print(stderr, "{} requires {}\n", options.command, flag);
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  signal(SIGPIPE, SIG_IGN);

  Options options;
  if (!parseArgs(argc, argv, options)) {
    printUsage(argv[0]);
    return kExitUsage;
  }

  try {
    config::Config config = buildConfig(options);
    configureLogging(config);
    Context context = Context::create(config);

    if (options.command == "login") {
      if (options.force) {
        auth::ClientRegistrar registrar(context);
        auth::TokenStore(context, registrar).clear();
      }
      return runLogin(context);
    }
    if (options.command == "logout") {
      return runLogout(context, options.all);
    }
    if (options.command == "status") {
      return runStatus(context);
    }
    if (options.command == "proxy") {
      return runProxy(context, options.relay_url);
    }
    if (options.command == "request") {
      if (!requireOption(options, options.prompt, "--prompt")) {
        return kExitUsage;
      }
      return runRequest(context, options);
    }
    if (options.command == "notify") {
      if (!requireOption(options, options.message, "--message")) {
        return kExitUsage;
      }
      return runNotify(context, options);
    }
    if (options.command == "notify-completion") {
      if (!requireOption(options, options.summary, "--summary")) {
        return kExitUsage;
      }
      return runNotifyCompletion(context, options);
    }

    fmt::print(stderr, "Unknown command: {}\n", options.command);
    printUsage(argv[0]);
    return kExitUsage;
  } catch (const HitlError& e) {
    HITL_LOG(Error, "{} failed: {} ({})", options.command, e.what(),
             errorCodeToString(e.code()));
    if (e.code() == ErrorCode::REAUTHENTICATION_REQUIRED) {
      fmt::print(stderr,
                 "Not logged in or session expired. Run 'hitl-cli login'.\n");
    } else if (e.code() == ErrorCode::CANCELLED) {
      return kExitInterrupted;
    } else {
      fmt::print(stderr, "Error: {}\n", e.what());
    }
    return kExitFailure;
  }
}
