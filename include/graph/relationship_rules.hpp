#pragma once

#include "model/financial_models.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ag {

/**
 * @brief A relationship proposed by a rule for one pair of assets
 */
struct InferredRelationship {
    std::string source_id;
    std::string target_id;
    std::string relationship_type;
    double strength = 0.0;
    bool bidirectional = false;
};

/**
 * @brief Abstract pairwise inference rule
 *
 * Rules are evaluated once per unordered asset pair during
 * AssetGraph::build_relationships(). They must be stateless: the same pair
 * always yields the same answer.
 */
class RelationshipRule {
public:
    virtual ~RelationshipRule() = default;

    /**
     * @brief Relationship type tag this rule emits
     */
    virtual std::string name() const = 0;

    virtual std::optional<InferredRelationship> evaluate(
        const Asset& first,
        const Asset& second
    ) const = 0;
};

using RulePtr = std::shared_ptr<const RelationshipRule>;

/**
 * @brief Equal, known sectors produce a bidirectional edge (strength 0.7)
 */
class SameSectorRule : public RelationshipRule {
public:
    static constexpr const char* TYPE = "same_sector";
    static constexpr double STRENGTH = 0.7;

    std::string name() const override { return TYPE; }
    std::optional<InferredRelationship> evaluate(const Asset& first, const Asset& second) const override;
};

/**
 * @brief A bond links one-way to its issuer (strength 0.9)
 */
class CorporateLinkRule : public RelationshipRule {
public:
    static constexpr const char* TYPE = "corporate_link";
    static constexpr double STRENGTH = 0.9;

    std::string name() const override { return TYPE; }
    std::optional<InferredRelationship> evaluate(const Asset& first, const Asset& second) const override;
};

/// Type tag of edges created from regulatory events
constexpr const char* EVENT_IMPACT_TYPE = "event_impact";

/**
 * @brief The rules every new graph starts with: same_sector, corporate_link
 */
std::vector<RulePtr> default_rules();

/**
 * @brief Create a rule by its type tag
 * @throws std::invalid_argument for an unknown rule name
 */
RulePtr create_rule(const std::string& name);

/**
 * @brief Names accepted by create_rule()
 */
std::vector<std::string> available_rule_names();

} // namespace ag
