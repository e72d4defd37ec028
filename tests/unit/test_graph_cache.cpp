#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "data/graph_cache.hpp"
#include "data/sample_data.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace ag;

class GraphCacheTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
                   ("assetgraph_cache_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                    "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }
};

// ==========================================
// Serialization Tests
// ==========================================

TEST_F(GraphCacheTest, SnapshotShape) {
    AssetGraph graph;
    graph.add_asset(make_equity("A", "A", "Alpha", "Tech", 10.0));
    graph.add_asset(make_equity("B", "B", "Beta", "Tech", 20.0));
    graph.build_relationships();

    auto payload = GraphCache::serialize_graph(graph);
    ASSERT_TRUE(payload["assets"].is_array());
    EXPECT_EQ(payload["assets"].size(), 2u);
    EXPECT_EQ(payload["assets"][0]["__type__"], "Equity");
    EXPECT_TRUE(payload["regulatory_events"].is_array());
    EXPECT_EQ(payload["relationships"]["A"][0]["target"], "B");
    EXPECT_EQ(payload["incoming_relationships"]["B"][0]["source"], "A");
}

TEST_F(GraphCacheTest, SampleRoundTrip) {
    AssetGraph original = create_sample_database();
    AssetGraph restored = GraphCache::deserialize_graph(GraphCache::serialize_graph(original));

    EXPECT_EQ(restored.num_assets(), original.num_assets());
    EXPECT_EQ(restored.regulatory_events().size(), original.regulatory_events().size());
    EXPECT_EQ(restored.relationships(), original.relationships());

    const Asset* bond = restored.get_asset("AAPL_BOND");
    ASSERT_NE(bond, nullptr);
    EXPECT_EQ(bond->asset_class, AssetClass::FIXED_INCOME);
    ASSERT_TRUE(bond->issuer_id.has_value());
    EXPECT_EQ(*bond->issuer_id, "AAPL");
}

TEST_F(GraphCacheTest, RelationshipsAreNotReinferred) {
    nlohmann::json payload = {
        {"assets", nlohmann::json::array({
            make_equity("A", "A", "Alpha", "Tech", 10.0).to_json(),
            make_equity("B", "B", "Beta", "Tech", 20.0).to_json()
        })},
        {"relationships", {{"A", nlohmann::json::array({nlohmann::json::array({"B", "custom", 0.4})})}}}
    };

    AssetGraph graph = GraphCache::deserialize_graph(payload);
    EXPECT_EQ(graph.num_relationships(), 1u);
    EXPECT_TRUE(graph.get_relationships("B").empty());
}

TEST_F(GraphCacheTest, MissingSectionsAreEmpty) {
    AssetGraph graph = GraphCache::deserialize_graph(nlohmann::json::object());
    EXPECT_TRUE(graph.empty());
}

TEST_F(GraphCacheTest, RejectsMalformedPayloads) {
    EXPECT_THROW(GraphCache::deserialize_graph(nlohmann::json::array()), StructuralValidationError);
    EXPECT_THROW(GraphCache::deserialize_graph({{"assets", "nope"}}), StructuralValidationError);
    EXPECT_THROW(GraphCache::deserialize_graph({{"relationships", nlohmann::json::array()}}),
                 StructuralValidationError);
    EXPECT_THROW(GraphCache::deserialize_graph({{"relationships", {{"A", nlohmann::json::array({
                     nlohmann::json::array({"B", "custom"})})}}}}),
                 StructuralValidationError);
    EXPECT_THROW(GraphCache::deserialize_graph({{"assets", nlohmann::json::array({{{"id", "A"}}})}}),
                 ConstructionError);
}

// ==========================================
// File Tests
// ==========================================

TEST_F(GraphCacheTest, SaveAndLoad) {
    AssetGraph original = create_sample_database();
    const auto path = (temp_dir / "nested" / "graph.json").string();

    GraphCache::save_to_cache(original, path);
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    AssetGraph loaded = GraphCache::load_from_cache(path);
    EXPECT_EQ(loaded.num_assets(), 12u);
    EXPECT_EQ(loaded.num_relationships(), 18u);
    EXPECT_EQ(loaded.relationships(), original.relationships());
}

TEST_F(GraphCacheTest, SaveReplacesExistingFile) {
    const auto path = (temp_dir / "graph.json").string();
    write_file(path, "stale");

    AssetGraph graph;
    graph.add_asset(make_equity("A", "A", "Alpha", "Tech", 10.0));
    GraphCache::save_to_cache(graph, path);

    EXPECT_EQ(GraphCache::load_from_cache(path).num_assets(), 1u);
}

TEST_F(GraphCacheTest, LoadMissingFileThrows) {
    EXPECT_THROW(GraphCache::load_from_cache((temp_dir / "missing.json").string()), std::runtime_error);
}

TEST_F(GraphCacheTest, LoadCorruptFileThrows) {
    const auto path = temp_dir / "corrupt.json";
    write_file(path, "{ not json");
    EXPECT_THROW(GraphCache::load_from_cache(path.string()), std::runtime_error);
}
