#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "index/relationship_index.hpp"
#include <limits>

using namespace ag;

class RelationshipIndexTest : public ::testing::Test {
protected:
    RelationshipMap relationships;
    std::vector<std::string> ids{"A", "B", "C"};

    void SetUp() override {
        relationships["A"] = {{"B", "same_sector", 0.7}, {"C", "event_impact", 0.2}, {"X", "custom", 0.1}};
        relationships["B"] = {{"A", "same_sector", 0.7}};
        relationships["X"] = {{"A", "custom", 0.3}};
    }
};

// ==========================================
// Build Tests
// ==========================================

TEST_F(RelationshipIndexTest, KeepsOnlyRequestedEndpoints) {
    RelationshipIndex index;
    index.build(relationships, ids);

    EXPECT_EQ(index.size(), 3u);
    EXPECT_TRUE(index.contains({"A", "B", "same_sector"}));
    EXPECT_FALSE(index.contains({"A", "X", "custom"}));
    EXPECT_FALSE(index.contains({"X", "A", "custom"}));
}

TEST_F(RelationshipIndexTest, PreservesInsertionOrder) {
    RelationshipIndex index;
    index.build(relationships, ids);

    const auto& entries = index.entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].key.target_id, "B");
    EXPECT_EQ(entries[1].key.target_id, "C");
    EXPECT_EQ(entries[2].key.source_id, "B");
}

TEST_F(RelationshipIndexTest, ReverseLookup) {
    RelationshipIndex index;
    index.build(relationships, ids);

    EXPECT_TRUE(index.has_reverse({"A", "B", "same_sector"}));
    EXPECT_FALSE(index.has_reverse({"A", "C", "event_impact"}));
    EXPECT_FALSE(index.has_reverse({"B", "A", "event_impact"}));
}

TEST_F(RelationshipIndexTest, StrengthLookup) {
    RelationshipIndex index;
    index.build(relationships, ids);

    auto strength = index.strength({"A", "C", "event_impact"});
    ASSERT_TRUE(strength.has_value());
    EXPECT_DOUBLE_EQ(*strength, 0.2);
    EXPECT_FALSE(index.strength({"C", "A", "event_impact"}).has_value());
}

TEST_F(RelationshipIndexTest, PositionOf) {
    RelationshipIndex index;
    index.build(relationships, {"C", "A", "B"});
    EXPECT_EQ(index.position_of("C"), 0u);
    EXPECT_EQ(index.position_of("B"), 2u);
    EXPECT_THROW(index.position_of("X"), StructuralValidationError);
}

TEST_F(RelationshipIndexTest, RejectsDuplicateOrEmptyIds) {
    RelationshipIndex index;
    EXPECT_THROW(index.build(relationships, {"A", "A"}), StructuralValidationError);
    EXPECT_THROW(index.build(relationships, {"A", ""}), StructuralValidationError);
}

TEST_F(RelationshipIndexTest, RejectsNonFiniteStrength) {
    relationships["A"].push_back({"B", "custom", std::numeric_limits<double>::infinity()});
    RelationshipIndex index;
    EXPECT_THROW(index.build(relationships, ids), StructuralValidationError);
}

TEST_F(RelationshipIndexTest, ClearEmptiesIndex) {
    RelationshipIndex index;
    index.build(relationships, ids);
    index.clear();
    EXPECT_TRUE(index.empty());
    EXPECT_TRUE(index.asset_positions.empty());
}

// ==========================================
// Untyped Payload Tests
// ==========================================

TEST(RelationshipIndexJsonTest, AcceptsObjectsAndTuples) {
    nlohmann::json payload = {
        {"A", nlohmann::json::array({
            {{"target", "B"}, {"relationship_type", "same_sector"}, {"strength", 0.7}},
            nlohmann::json::array({"C", "event_impact", "0.25"})
        })}
    };

    RelationshipIndex index;
    index.build_from_json(payload, {"A", "B", "C"});
    ASSERT_EQ(index.size(), 2u);
    EXPECT_DOUBLE_EQ(*index.strength({"A", "C", "event_impact"}), 0.25);
}

TEST(RelationshipIndexJsonTest, RejectsMalformedPayloads) {
    RelationshipIndex index;
    EXPECT_THROW(index.build_from_json(nlohmann::json::array(), {"A"}), StructuralValidationError);
    EXPECT_THROW(index.build_from_json({{"A", "B"}}, {"A"}), StructuralValidationError);
}

TEST(RelationshipIndexJsonTest, ParseEntryValidation) {
    EXPECT_THROW(RelationshipIndex::parse_entry(nlohmann::json::array({"B", "t"}), 0, "A"),
                 StructuralValidationError);
    EXPECT_THROW(RelationshipIndex::parse_entry(nlohmann::json::array({1, "t", 0.5}), 0, "A"),
                 StructuralValidationError);
    EXPECT_THROW(RelationshipIndex::parse_entry(nlohmann::json::array({"B", "", 0.5}), 0, "A"),
                 StructuralValidationError);
    EXPECT_THROW(RelationshipIndex::parse_entry(nlohmann::json::array({"B", "t", "strong"}), 0, "A"),
                 StructuralValidationError);
    EXPECT_THROW(RelationshipIndex::parse_entry(nlohmann::json::array({"B", "t", nullptr}), 0, "A"),
                 StructuralValidationError);
    EXPECT_THROW(RelationshipIndex::parse_entry(42, 0, "A"), StructuralValidationError);

    Relationship rel = RelationshipIndex::parse_entry(nlohmann::json::array({"B", "t", 1}), 0, "A");
    EXPECT_EQ(rel.target_id, "B");
    EXPECT_DOUBLE_EQ(rel.strength, 1.0);
}

TEST(RelationshipIndexJsonTest, ErrorMessageNamesEntry) {
    try {
        RelationshipIndex::parse_entry(nlohmann::json::array({"B"}), 3, "SRC");
        FAIL() << "expected StructuralValidationError";
    } catch (const StructuralValidationError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("index 3"), std::string::npos);
        EXPECT_NE(message.find("SRC"), std::string::npos);
    }
}

TEST(EdgeKeyTest, CanonicalIsOrderIndependent) {
    EdgeKey forward{"A", "B", "t"};
    EdgeKey backward{"B", "A", "t"};
    EXPECT_EQ(forward.canonical(), backward.canonical());
    EXPECT_EQ(EdgeKeyHash{}(forward.canonical()), EdgeKeyHash{}(backward.canonical()));
}
