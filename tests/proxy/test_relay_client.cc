#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "hitl/core/error.h"
#include "hitl/proxy/relay_client.h"

#include "../mocks/http_mocks.h"
#include "../mocks/temp_dir.h"
#include "../mocks/test_context.h"

namespace hitl {
namespace proxy {
namespace {

const http::Authorization kAccess = http::Authorization::bearer("access-1");

using nlohmann::json;

http::HttpResponse sseResponse(int status, const std::string& body) {
  http::HttpResponse response;
  response.status_code = status;
  response.headers["content-type"] = "text/event-stream";
  response.body = body;
  return response;
}

json toolsCall(int id) {
  return {{"jsonrpc", "2.0"},
          {"id", id},
          {"method", "tools/call"},
          {"params", {{"name", "list_files"}, {"arguments", json::object()}}}};
}

class RelayClientTest : public ::testing::Test {
 protected:
  RelayClientTest()
      : transport_(std::make_shared<test::FakeHttpTransport>()),
        context_(test::makeTestContext(dir_.path(), transport_)),
        relay_(context_, context_.config.relayUrl(), "build-bot") {}

  test::TempDir dir_;
  std::shared_ptr<test::FakeHttpTransport> transport_;
  Context context_;
  RelayClient relay_;
};

TEST(EventStreamTest, ParsesMultipleEvents) {
  auto messages = RelayClient::parseEventStream(
      "event: message\r\n"
      "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\"}\r\n"
      "\r\n"
      ": keep-alive\n"
      "id: 2\n"
      "data: {\"jsonrpc\":\"2.0\",\"id\":1,\n"
      "data: \"result\":{}}\n"
      "\n");

  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0]["method"], "notifications/progress");
  EXPECT_EQ(messages[1]["id"], 1);
  EXPECT_TRUE(messages[1].contains("result"));
}

TEST(EventStreamTest, FlushesFinalEventWithoutBlankLine) {
  auto messages =
      RelayClient::parseEventStream("data:{\"jsonrpc\":\"2.0\",\"id\":3,\"result\":1}");
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0]["id"], 3);
}

TEST(EventStreamTest, SkipsNonJsonData) {
  auto messages = RelayClient::parseEventStream("data: ping\n\ndata: [1]\n\n");
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_TRUE(messages[0].is_array());
  EXPECT_TRUE(RelayClient::parseEventStream("").empty());
}

TEST_F(RelayClientTest, PostsJsonRpcWithHeaders) {
  transport_->setHandler([](const http::HttpRequest& request) {
    auto body = json::parse(request.body);
    return test::jsonResponse(
        200, {{"jsonrpc", "2.0"}, {"id", body["id"]}, {"result", {{"ok", true}}}});
  });

  auto reply = relay_.send(toolsCall(5), kAccess);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ((*reply)["id"], 5);
  EXPECT_TRUE((*reply)["result"]["ok"].get<bool>());

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  const auto& request = requests[0];
  EXPECT_EQ(request.url, std::string(test::kTestBackend) + "/mcp-server/mcp/");
  EXPECT_EQ(request.method, http::HttpMethod::POST);
  EXPECT_EQ(request.headers.at("Authorization"), "Bearer access-1");
  EXPECT_EQ(request.headers.at("X-MCP-Agent-Name"), "build-bot");
  EXPECT_EQ(request.headers.at("Accept"), "application/json, text/event-stream");
  EXPECT_EQ(request.headers.count("Mcp-Session-Id"), 0u);
  EXPECT_FALSE(request.idempotent);
  EXPECT_EQ(request.timeout, context_.config.relay_call_timeout);
}

TEST_F(RelayClientTest, ApiKeyReplacesBearerHeader) {
  transport_->setHandler([](const http::HttpRequest& request) {
    auto body = json::parse(request.body);
    return test::jsonResponse(
        200, {{"jsonrpc", "2.0"}, {"id", body["id"]}, {"result", json::object()}});
  });

  relay_.send(toolsCall(1), http::Authorization::apiKey("hk_live_42"));

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].headers.at("X-API-Key"), "hk_live_42");
  EXPECT_EQ(requests[0].headers.count("Authorization"), 0u);
}

TEST(AuthorizationTest, BearerTokenOnlyForBearerKind) {
  auto bearer = http::Authorization::bearer("jwt.payload.sig");
  EXPECT_EQ(bearer.header, "Authorization");
  EXPECT_EQ(bearer.value, "Bearer jwt.payload.sig");
  EXPECT_EQ(bearer.bearerToken(), "jwt.payload.sig");

  auto key = http::Authorization::apiKey("hk_live_42");
  EXPECT_EQ(key.header, "X-API-Key");
  EXPECT_EQ(key.bearerToken(), "");
  EXPECT_FALSE(key == bearer);
}

TEST_F(RelayClientTest, PicksMatchingResponseFromEventStream) {
  transport_->setHandler([](const http::HttpRequest&) {
    return sseResponse(
        200,
        "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\"}\n\n"
        "data: {\"jsonrpc\":\"2.0\",\"id\":99,\"result\":\"other\"}\n\n"
        "data: {\"jsonrpc\":\"2.0\",\"id\":7,\"result\":\"mine\"}\n\n");
  });

  auto reply = relay_.send(toolsCall(7), kAccess);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ((*reply)["result"], "mine");
}

TEST_F(RelayClientTest, RemembersSessionId) {
  transport_->setHandler([](const http::HttpRequest&) {
    auto response = test::jsonResponse(
        200, {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});
    response.headers["mcp-session-id"] = "session-abc";
    return response;
  });

  relay_.send(toolsCall(1), kAccess);
  EXPECT_EQ(relay_.sessionId(), "session-abc");

  relay_.send(toolsCall(1), kAccess);
  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[1].headers.at("Mcp-Session-Id"), "session-abc");
}

TEST_F(RelayClientTest, ExpiredSessionIsForgotten) {
  transport_->setHandler([](const http::HttpRequest&) {
    auto response = test::jsonResponse(
        200, {{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}});
    response.headers["mcp-session-id"] = "session-abc";
    return response;
  });
  relay_.send(toolsCall(1), kAccess);

  transport_->setHandler([](const http::HttpRequest&) {
    return test::textResponse(404, "unknown session");
  });
  EXPECT_THROW(relay_.send(toolsCall(2), kAccess), HitlError);
  EXPECT_EQ(relay_.sessionId(), "");
}

TEST_F(RelayClientTest, AcceptedNotificationHasNoReply) {
  transport_->setHandler([](const http::HttpRequest&) {
    return test::textResponse(202, "");
  });
  json notification = {{"jsonrpc", "2.0"},
                       {"method", "notifications/initialized"}};
  EXPECT_FALSE(relay_.send(notification, kAccess).has_value());
}

TEST_F(RelayClientTest, UnauthorizedRequiresReauthentication) {
  transport_->setHandler([](const http::HttpRequest&) {
    return test::jsonResponse(401, {{"detail", "expired"}});
  });
  try {
    relay_.send(toolsCall(1), http::Authorization::bearer("stale"));
    FAIL();
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::REAUTHENTICATION_REQUIRED);
  }
}

TEST_F(RelayClientTest, JsonRpcErrorBodyIsRelayedDespiteStatus) {
  transport_->setHandler([](const http::HttpRequest&) {
    return test::jsonResponse(
        400, {{"jsonrpc", "2.0"},
              {"id", 4},
              {"error", {{"code", -32602}, {"message", "bad params"}}}});
  });

  auto reply = relay_.send(toolsCall(4), kAccess);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ((*reply)["error"]["code"], -32602);
}

TEST_F(RelayClientTest, ServerErrorWithoutJsonRpcBodyIsNetworkError) {
  transport_->setHandler([](const http::HttpRequest&) {
    return test::textResponse(502, "bad gateway");
  });
  try {
    relay_.send(toolsCall(1), kAccess);
    FAIL();
  } catch (const HitlError& e) {
    EXPECT_EQ(e.code(), ErrorCode::NETWORK_ERROR);
  }
}

TEST_F(RelayClientTest, TransportFailurePropagates) {
  EXPECT_THROW(relay_.send(toolsCall(1), kAccess), HitlError);
}

}  // namespace
}  // namespace proxy
}  // namespace hitl
