#include <gtest/gtest.h>
#include "data/sample_data.hpp"
#include "service/relationship_manager.hpp"

using namespace ag;

class RelationshipManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<ThreadSafeGraph> graph;
    std::unique_ptr<RelationshipManager> manager;

    void SetUp() override {
        graph = std::make_shared<ThreadSafeGraph>(create_sample_database());
        manager = std::make_unique<RelationshipManager>(graph);
    }
};

// ==========================================
// Tool Tests
// ==========================================

TEST_F(RelationshipManagerTest, AddEquitySuccess) {
    auto result = manager->add_equity_node("NVDA", "NVDA", "NVIDIA Corporation", "Technology", 480.0);
    EXPECT_EQ(result, "Successfully added: NVIDIA Corporation (NVDA)");
    EXPECT_EQ(graph->num_assets(), 13u);
}

TEST_F(RelationshipManagerTest, AddEquityValidationError) {
    auto result = manager->add_equity_node("BAD", "BAD", "Bad Corp", "Technology", -1.0);
    EXPECT_EQ(result.rfind("Validation Error: ", 0), 0u);
    EXPECT_EQ(graph->num_assets(), 12u);
}

TEST_F(RelationshipManagerTest, RebuildAfterAdd) {
    manager->add_equity_node("NVDA", "NVDA", "NVIDIA Corporation", "Technology", 480.0);
    manager->rebuild_relationships();

    auto metrics = graph->calculate_metrics();
    // NVDA joins the AAPL/MSFT technology cluster: 4 new same_sector edges
    EXPECT_EQ(metrics.total_relationships, 22u);
}

TEST_F(RelationshipManagerTest, LayoutJson) {
    auto layout = nlohmann::json::parse(manager->layout_json());

    ASSERT_TRUE(layout["asset_ids"].is_array());
    EXPECT_EQ(layout["asset_ids"].size(), 12u);
    EXPECT_EQ(layout["asset_ids"][0], "AAPL");
    EXPECT_EQ(layout["positions"][0].size(), 3u);
    EXPECT_EQ(layout["colors"][0], "#4ECDC4");
    EXPECT_EQ(layout["hover"][0], "Asset: AAPL");
}

TEST_F(RelationshipManagerTest, MetricsJson) {
    auto metrics = nlohmann::json::parse(manager->metrics_json());
    EXPECT_EQ(metrics["total_relationships"], 18);
    EXPECT_EQ(metrics["regulatory_event_count"], 3);
}

TEST_F(RelationshipManagerTest, SharesGraphWithOtherHolders) {
    RelationshipManager other(graph);
    other.add_equity_node("NVDA", "NVDA", "NVIDIA Corporation", "Technology", 480.0);
    EXPECT_EQ(manager->graph()->num_assets(), 13u);
}

TEST(RelationshipManagerConstructionTest, RejectsNullGraph) {
    EXPECT_THROW(RelationshipManager(nullptr), std::invalid_argument);
    EXPECT_STREQ(RelationshipManager::NAME, "AssetGraph-Relationship-Manager");
}
