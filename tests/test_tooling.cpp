#include <gtest/gtest.h>

#include "mcp_client.hpp"
#include "test_support.hpp"
#include "tool_capabilities.hpp"
#include "tooling.hpp"

#include <httplib.h>

#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace chatgen;
using chatgen::fakes::FakeFetcher;
using chatgen::fakes::SimpleSchema;

class ToolRegistryTest : public ::testing::Test {
 protected:
  ToolRegistry registry;

  void SetUp() override {
    registry.RegisterTool(SimpleSchema("zeta"), [](const std::string& id, const nlohmann::json& args) {
      ToolResult r;
      r.tool_call_id = id;
      r.result = {{"echo", args}};
      return r;
    });
    registry.RegisterTool(SimpleSchema("alpha"), [](const std::string&, const nlohmann::json&) -> ToolResult {
      throw std::runtime_error("backend down");
    });
  }
};

TEST_F(ToolRegistryTest, ListsSchemasSortedByName) {
  auto schemas = registry.ListSchemas();
  ASSERT_EQ(schemas.size(), 2u);
  EXPECT_EQ(schemas[0].name, "alpha");
  EXPECT_EQ(schemas[1].name, "zeta");
  EXPECT_EQ(ExtractToolNames(schemas), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST_F(ToolRegistryTest, FilterKeepsOnlyKnownNames) {
  auto filtered = registry.FilterSchemas({"zeta", "missing"});
  ASSERT_EQ(filtered.size(), 1u);
  EXPECT_EQ(filtered[0].name, "zeta");
}

TEST_F(ToolRegistryTest, ExecuteStampsIdAndName) {
  ToolCall call{"call-1", "zeta", {{"q", "x"}}};
  auto r = registry.Execute(call);
  EXPECT_TRUE(r.ok);
  EXPECT_EQ(r.tool_call_id, "call-1");
  EXPECT_EQ(r.name, "zeta");
  EXPECT_EQ(r.result["echo"]["q"], "x");
}

TEST_F(ToolRegistryTest, ThrowingHandlerBecomesErrorResult) {
  auto r = registry.Execute(ToolCall{"call-2", "alpha", nlohmann::json::object()});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.result["error"], "backend down");
  EXPECT_EQ(r.tool_call_id, "call-2");
}

TEST_F(ToolRegistryTest, NonStandardThrowBecomesErrorResult) {
  registry.RegisterTool(SimpleSchema("odd"), [](const std::string&, const nlohmann::json&) -> ToolResult {
    throw 42;
  });
  ToolResult r;
  EXPECT_NO_THROW(r = registry.Execute(ToolCall{"call-4", "odd", nlohmann::json::object()}));
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.result["error"], "unknown tool failure");
  EXPECT_EQ(r.name, "odd");
}

TEST_F(ToolRegistryTest, UnknownToolBecomesErrorResult) {
  auto r = registry.Execute(ToolCall{"call-3", "nope", nlohmann::json::object()});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.result["error"], "unknown tool: nope");
}

TEST(ToolCapabilitiesTest, CanonicalizesAliases) {
  EXPECT_EQ(CanonicalCapability("Web-Search"), "brave-search");
  EXPECT_EQ(CanonicalCapability("video"), "youtube");
  EXPECT_EQ(CanonicalCapability("docs"), "docs");
  EXPECT_EQ(DefaultEnabledCapabilities(), (std::vector<std::string>{"brave-search"}));
}

TEST(ToolCapabilitiesTest, MissingCredentialsYieldEmptyRegistry) {
  FakeFetcher fetcher;
  CapabilityToolProvider provider(ToolCredentials{}, &fetcher);
  auto tools = provider.LookupEnabledTools({"brave-search", "youtube", "unknown-server"});
  ASSERT_TRUE(tools);
  EXPECT_TRUE(tools->Empty());
  EXPECT_TRUE(fetcher.urls().empty());
}

TEST(ToolCapabilitiesTest, RegistersToolsPerEnabledCapability) {
  FakeFetcher fetcher;
  CapabilityToolProvider provider(ToolCredentials{"brave-key", "yt-key"}, &fetcher);
  auto both = provider.LookupEnabledTools({"web-search", "brave-search", "youtube"});
  EXPECT_TRUE(both->HasTool("brave_web_search"));
  EXPECT_TRUE(both->HasTool("brave_news_search"));
  EXPECT_TRUE(both->HasTool("youtube_search"));
  EXPECT_EQ(both->Size(), 5u);

  auto none = provider.LookupEnabledTools({});
  EXPECT_TRUE(none->Empty());
}

// Minimal JSON-RPC MCP server on loopback that counts calls per method.
class LocalMcpServer {
 public:
  explicit LocalMcpServer(nlohmann::json tools) : tools_(std::move(tools)) {
    server_.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
      auto j = nlohmann::json::parse(req.body, nullptr, false);
      const auto method = j.is_object() ? j.value("method", "") : std::string();
      {
        std::lock_guard<std::mutex> lock(mu_);
        ++calls_[method];
      }
      if (!j.contains("id")) {
        res.status = 202;
        return;
      }
      nlohmann::json result = nlohmann::json::object();
      if (method == "tools/list") result["tools"] = tools_;
      res.set_content(nlohmann::json{{"jsonrpc", "2.0"}, {"id", j["id"]}, {"result", result}}.dump(),
                      "application/json");
    });
    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 200 && !server_.is_running(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  ~LocalMcpServer() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
  }

  McpServerConfig Config(const std::string& slug) const {
    McpServerConfig c;
    c.slug = slug;
    c.endpoint.host = "127.0.0.1";
    c.endpoint.port = port_;
    c.endpoint.base_path = "/mcp";
    return c;
  }

  int Calls(const std::string& method) {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_[method];
  }

 private:
  nlohmann::json tools_;
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
  std::mutex mu_;
  std::map<std::string, int> calls_;
};

TEST(RemoteToolsTest, ServerWithNoToolsIsDiscoveredOnce) {
  LocalMcpServer server(nlohmann::json::array());
  ASSERT_GT(server.Config("notes").endpoint.port, 0);
  FakeFetcher fetcher;
  CapabilityToolProvider provider(ToolCredentials{}, &fetcher, {server.Config("notes")});

  EXPECT_TRUE(provider.LookupEnabledTools({"notes"})->Empty());
  EXPECT_TRUE(provider.LookupEnabledTools({"notes"})->Empty());

  EXPECT_EQ(server.Calls("initialize"), 1);
  EXPECT_EQ(server.Calls("tools/list"), 1);
}

TEST(RemoteToolsTest, DiscoveredToolsAreExposedUnderTheSlug) {
  LocalMcpServer server(nlohmann::json::array(
      {{{"name", "lookup"}, {"description", "find a note"}, {"inputSchema", {{"type", "object"}}}}}));
  FakeFetcher fetcher;
  CapabilityToolProvider provider(ToolCredentials{}, &fetcher, {server.Config("notes")});

  auto first = provider.LookupEnabledTools({"notes"});
  auto second = provider.LookupEnabledTools({"notes"});
  EXPECT_TRUE(first->HasTool("notes__lookup"));
  EXPECT_TRUE(second->HasTool("notes__lookup"));
  EXPECT_EQ(server.Calls("tools/list"), 1);
}

TEST(McpOutputTest, PrefersStructuredContent) {
  bool is_error = true;
  auto out = McpResultToToolOutput({{"structuredContent", {{"n", 1}}}, {"content", nlohmann::json::array()}},
                                   &is_error);
  EXPECT_FALSE(is_error);
  EXPECT_EQ(out["n"], 1);
}

TEST(McpOutputTest, JoinsTextAndFlagsErrors) {
  bool is_error = false;
  nlohmann::json result = {{"isError", true},
                           {"content", nlohmann::json::array({{{"type", "text"}, {"text", "quota exceeded"}}})}};
  auto out = McpResultToToolOutput(result, &is_error);
  EXPECT_TRUE(is_error);
  EXPECT_EQ(out["error"], "quota exceeded");

  nlohmann::json plain = {{"content", nlohmann::json::array({{{"type", "text"}, {"text", "hello"}}})}};
  EXPECT_EQ(McpResultToToolOutput(plain, &is_error)["text"], "hello");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
