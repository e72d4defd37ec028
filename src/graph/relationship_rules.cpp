#include "graph/relationship_rules.hpp"
#include <stdexcept>

namespace ag {

std::optional<InferredRelationship> SameSectorRule::evaluate(
    const Asset& first,
    const Asset& second
) const {
    if (first.sector != second.sector || first.sector == Asset::UNKNOWN_SECTOR) {
        return std::nullopt;
    }
    return InferredRelationship{first.id, second.id, TYPE, STRENGTH, true};
}

std::optional<InferredRelationship> CorporateLinkRule::evaluate(
    const Asset& first,
    const Asset& second
) const {
    if (first.is_bond() && first.issuer_id && *first.issuer_id == second.id) {
        return InferredRelationship{first.id, second.id, TYPE, STRENGTH, false};
    }
    if (second.is_bond() && second.issuer_id && *second.issuer_id == first.id) {
        return InferredRelationship{second.id, first.id, TYPE, STRENGTH, false};
    }
    return std::nullopt;
}

std::vector<RulePtr> default_rules() {
    return {
        std::make_shared<SameSectorRule>(),
        std::make_shared<CorporateLinkRule>()
    };
}

RulePtr create_rule(const std::string& name) {
    if (name == SameSectorRule::TYPE) {
        return std::make_shared<SameSectorRule>();
    }
    if (name == CorporateLinkRule::TYPE) {
        return std::make_shared<CorporateLinkRule>();
    }
    throw std::invalid_argument("Unknown relationship rule: " + name);
}

std::vector<std::string> available_rule_names() {
    return {SameSectorRule::TYPE, CorporateLinkRule::TYPE};
}

} // namespace ag
