// tests/integration/test_component_graph.cpp - Unit tests for component graphs and contracts
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "defcheck/integration/component_graph.hpp"

using namespace defcheck;

namespace fs = std::filesystem;

// ============================================================================
// Helper Functions
// ============================================================================

static ContractFacts must_load(const std::string & text)
{
  auto result = load_contract_from_string(text);
  EXPECT_TRUE(result.success) << result.error;
  return result.facts;
}

static const ComponentEdge * find_edge(
  const ComponentGraph & graph, const std::string & caller, const std::string & callee)
{
  for (const auto & e : graph.edges()) {
    if (e.caller == caller && e.callee == callee) return &e;
  }
  return nullptr;
}

static void write_file(const fs::path & path, const std::string & content)
{
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

// ============================================================================
// Contract Loading Tests
// ============================================================================

TEST(ContractLoaderTest, ExtractsTimeoutAndFormats)
{
  const ContractFacts facts = must_load(R"(
openapi: 3.0.0
info:
  title: Orders
  x-timeout: 12.4
components:
  schemas:
    Order:
      properties:
        order_id:
          type: string
          format: uuid
        status:
          type: string
          enum: [shipped, pending]
        note:
          type: string
          nullable: true
        created:
          type: string
          format: date-time
)");
  ASSERT_TRUE(facts.timeout.has_value());
  EXPECT_EQ(*facts.timeout, 12);
  EXPECT_EQ(facts.datetime_format.value_or(""), "ISO8601");
  EXPECT_EQ(facts.id_format.value_or(""), "UUID");

  const std::string status = "components.schemas.Order.properties.status";
  ASSERT_EQ(facts.enums.count(status), 1U);
  EXPECT_EQ(facts.enums.at(status), (std::vector<std::string>{"pending", "shipped"}));

  const std::string note = "components.schemas.Order.properties.note";
  ASSERT_EQ(facts.nullables.count(note), 1U);
  EXPECT_TRUE(facts.nullables.at(note));
}

TEST(ContractLoaderTest, TextualDatetimeHintsWin)
{
  EXPECT_EQ(must_load("x-timeout: 5\ndescription: timestamps are unix seconds\n")
              .datetime_format.value_or(""),
            "Unix timestamp");
  EXPECT_EQ(must_load("description: RFC3339 dates\n").datetime_format.value_or(""), "RFC3339");
  EXPECT_FALSE(must_load("title: plain\n").datetime_format.has_value());
}

TEST(ContractLoaderTest, IntegerIdsAndTopLevelTimeout)
{
  const ContractFacts facts = must_load(R"({"x-timeout": 30, "properties": {"id": {"type": "integer"}}})");
  EXPECT_EQ(facts.timeout.value_or(0), 30);
  EXPECT_EQ(facts.id_format.value_or(""), "integer");
}

TEST(ContractLoaderTest, RejectsMalformedContracts)
{
  EXPECT_FALSE(load_contract_from_string("- a\n- b\n").success);
  EXPECT_FALSE(load_contract_from_string("key: [unterminated\n").success);
  EXPECT_TRUE(load_contract_from_string("").success);
}

TEST(ContractLoaderTest, RejectsUnrepresentableTimeouts)
{
  for (const char * text :
       {"x-timeout: 1e12\n", "x-timeout: 2147483647\n", "x-timeout: -3\n", "x-timeout: .nan\n",
        "x-timeout: .inf\n", "info:\n  x-timeout: 1e12\n", "x-timeout: soon\n"}) {
    const auto result = load_contract_from_string(text);
    EXPECT_FALSE(result.success) << text;
    EXPECT_FALSE(result.error.empty()) << text;
  }

  const auto longest =
    load_contract_from_string("x-timeout: " + std::to_string(k_max_contract_timeout) + "\n");
  ASSERT_TRUE(longest.success) << longest.error;
  EXPECT_EQ(longest.facts.timeout.value_or(0), k_max_contract_timeout);
}

TEST(ContractLoaderTest, ComponentNameFromFileName)
{
  EXPECT_EQ(contract_component_name("contracts/billing_api.yaml"), "billing");
  EXPECT_EQ(contract_component_name("contracts/user-service-api.yml"), "user-service");
  EXPECT_EQ(contract_component_name("contracts/orders.json"), "orders");
  EXPECT_EQ(contract_component_name("contracts/_api.yaml"), "_api");
}

// ============================================================================
// Edge Derivation Tests
// ============================================================================

TEST(ComponentGraphTest, ImportCreatesEdge)
{
  ComponentGraphBuilder builder;
  builder.add_source("orders", "orders/service.py", R"(from components.billing import client

def place(order):
    return client.charge(order)
)");
  builder.add_source("billing", "billing/client.py", "def charge(order):\n    return True\n");

  const ComponentGraph graph = builder.build();
  EXPECT_EQ(graph.components().size(), 2U);
  ASSERT_EQ(graph.edges().size(), 1U);

  const ComponentEdge * e = find_edge(graph, "orders", "billing");
  ASSERT_NE(e, nullptr);
  EXPECT_FALSE(e->has_error_handling);
  EXPECT_FALSE(e->has_retry);
  EXPECT_EQ(find_edge(graph, "billing", "orders"), nullptr);
  EXPECT_EQ(graph.successors("orders"), (std::set<std::string>{"billing"}));
}

TEST(ComponentGraphTest, TryBodyUsingImportedNameCountsAsHandling)
{
  ComponentGraphBuilder builder;
  builder.add_source("orders", "orders/service.py", R"(from components.billing import client as pay

def place(order):
    try:
        return pay.charge(order)
    except Exception:
        return None
)");
  builder.add_component("billing");

  const ComponentGraph graph = builder.build();
  const ComponentEdge * e = find_edge(graph, "orders", "billing");
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(e->has_error_handling);
  EXPECT_FALSE(e->has_retry);
}

TEST(ComponentGraphTest, RetryAndCircuitMarkers)
{
  ComponentGraphBuilder builder;
  builder.add_source("gateway", "gateway/app.py", R"(import tenacity
from components.user_service import lookup

@tenacity.retry
def find(uid):
    return breaker.call(lookup, uid)
)");
  builder.add_source("gateway", "gateway/other.py", "def noop():\n    return None\n");
  builder.add_source("gateway", "gateway/names.py", "SERVICE = \"user-service\"\n");
  builder.add_component("user-service");

  const ComponentGraph graph = builder.build();
  const ComponentEdge * e = find_edge(graph, "gateway", "user-service");
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(e->has_retry);
  EXPECT_FALSE(e->has_error_handling);
}

TEST(ComponentGraphTest, QuotedServiceNameCreatesEdge)
{
  ComponentGraphBuilder builder;
  builder.add_source("web", "web/views.py", R"(def checkout(bus):
    # fallback to the queue when the call fails
    return bus.call("billing", "charge")
)");
  builder.add_component("billing");
  builder.add_source("billing", "billing/api.py", "BILLING_NAME = 'billingx'\n");

  const ComponentGraph graph = builder.build();
  const ComponentEdge * e = find_edge(graph, "web", "billing");
  ASSERT_NE(e, nullptr);
  EXPECT_TRUE(e->has_error_handling);
  EXPECT_EQ(find_edge(graph, "billing", "web"), nullptr);
}

TEST(ComponentGraphTest, ContractsSetTimeoutsOnKnownComponentsOnly)
{
  ComponentGraphBuilder builder;
  builder.add_component("orders");
  EXPECT_TRUE(builder.add_contract("orders", must_load("x-timeout: 10\n")));
  EXPECT_FALSE(builder.add_contract("ghost", must_load("x-timeout: 3\n")));

  const ComponentGraph graph = builder.build();
  const ComponentNode * orders = graph.find("orders");
  ASSERT_NE(orders, nullptr);
  EXPECT_EQ(orders->timeout.value_or(0), 10);
  EXPECT_TRUE(orders->contract.has_value());
  EXPECT_EQ(graph.find("ghost"), nullptr);
}

TEST(ComponentGraphTest, ParseFailuresBecomeNotes)
{
  ComponentGraphBuilder builder;
  builder.add_source("orders", "orders/broken.py", "import billing\ndef broken(:\n");
  builder.add_component("billing");

  const ComponentGraph graph = builder.build();
  // The textual reference still yields an edge.
  EXPECT_NE(find_edge(graph, "orders", "billing"), nullptr);
  ASSERT_EQ(builder.notes().size(), 1U);
  EXPECT_EQ(builder.notes()[0].kind, NoteKind::ParseError);
}

// ============================================================================
// Directory Scan Tests
// ============================================================================

TEST(ComponentGraphTest, ScanReadsComponentsAndContracts)
{
  const fs::path root = fs::temp_directory_path() / "defcheck_component_scan";
  fs::remove_all(root);
  write_file(root / "components" / "orders" / "service.py", "import billing\n");
  write_file(root / "components" / "orders" / "__pycache__" / "junk.py", "def (\n");
  write_file(root / "components" / "billing" / "api" / "handlers.py", "x = 1\n");
  write_file(root / "components" / ".hidden" / "x.py", "y = 2\n");
  write_file(root / "contracts" / "orders_api.yaml", "x-timeout: 10\n");
  write_file(root / "contracts" / "billing.json", "{\"x-timeout\": 8}\n");
  write_file(root / "contracts" / "broken.yaml", "key: [unterminated\n");
  write_file(root / "contracts" / "README.md", "not a contract\n");

  ComponentGraphBuilder builder;
  builder.scan(root / "components", root / "contracts");
  const ComponentGraph graph = builder.build();

  ASSERT_EQ(graph.components().size(), 2U);
  ASSERT_NE(graph.find("billing"), nullptr);
  EXPECT_EQ(graph.find("billing")->sources.size(), 1U);
  EXPECT_EQ(graph.find("orders")->sources.size(), 1U);
  EXPECT_EQ(graph.find("orders")->timeout.value_or(0), 10);
  EXPECT_EQ(graph.find("billing")->timeout.value_or(0), 8);
  EXPECT_NE(find_edge(graph, "orders", "billing"), nullptr);

  ASSERT_EQ(builder.notes().size(), 1U);
  EXPECT_EQ(builder.notes()[0].kind, NoteKind::ConfigError);

  fs::remove_all(root);
}
