#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ag {

// ============================================================================
// Enumerations
// ============================================================================

enum class AssetClass {
    EQUITY,
    FIXED_INCOME,
    COMMODITY,
    CURRENCY
};

enum class RegulatoryActivity {
    EARNINGS_REPORT,
    SEC_FILING,
    DIVIDEND_ANNOUNCEMENT,
    MERGER
};

/// Wire value, e.g. "fixed_income"
std::string asset_class_to_string(AssetClass asset_class);
AssetClass asset_class_from_string(const std::string& value);

std::string regulatory_activity_to_string(RegulatoryActivity activity);
RegulatoryActivity regulatory_activity_from_string(const std::string& value);

// ============================================================================
// Asset
// ============================================================================

/**
 * @brief A financial instrument record
 *
 * The constructor validates the identifying fields and the price; an Asset
 * that exists always has a non-empty id and a finite, strictly positive price.
 * Class-specific fields are optional and only meaningful for their class.
 */
struct Asset {
    static constexpr const char* UNKNOWN_SECTOR = "Unknown";

    std::string id;
    std::string symbol;
    std::string name;
    AssetClass asset_class = AssetClass::EQUITY;
    std::string sector = UNKNOWN_SECTOR;
    double price = 0.0;
    std::optional<double> market_cap;
    std::string currency = "USD";

    // Equity
    std::optional<double> pe_ratio;
    std::optional<double> dividend_yield;
    std::optional<double> earnings_per_share;
    std::optional<double> book_value;

    // Bond
    std::optional<double> yield_to_maturity;
    std::optional<double> coupon_rate;
    std::optional<std::string> maturity_date;
    std::optional<std::string> credit_rating;
    std::optional<std::string> issuer_id;

    // Commodity
    std::optional<double> contract_size;
    std::optional<std::string> delivery_date;
    std::optional<double> volatility;

    // Currency
    std::optional<double> exchange_rate;
    std::optional<std::string> country;
    std::optional<double> central_bank_rate;

    /**
     * @throws ConstructionError on empty id/symbol/name or a non-positive price
     */
    Asset(std::string id,
          std::string symbol,
          std::string name,
          AssetClass asset_class,
          std::string sector,
          double price);

    bool is_bond() const { return asset_class == AssetClass::FIXED_INCOME; }

    /**
     * @brief Snapshot type tag: "Equity", "Bond", "Commodity" or "Currency"
     */
    std::string type_name() const;

    nlohmann::json to_json() const;

    /**
     * @brief Rebuild an asset from a snapshot record
     * @throws ConstructionError when required fields are missing or invalid
     */
    static Asset from_json(const nlohmann::json& j);
};

// ============================================================================
// RegulatoryEvent
// ============================================================================

/**
 * @brief A dated occurrence on one asset that can induce event_impact edges
 */
struct RegulatoryEvent {
    std::string id;
    std::string asset_id;
    RegulatoryActivity event_type = RegulatoryActivity::EARNINGS_REPORT;
    std::string date;                          // ISO-8601
    std::string description;
    double impact_score = 0.0;                 // [-1, 1]
    std::vector<std::string> related_assets;   // order preserved

    /**
     * @throws ConstructionError on empty ids, a malformed date or an
     *         impact score outside [-1, 1]
     */
    RegulatoryEvent(std::string id,
                    std::string asset_id,
                    RegulatoryActivity event_type,
                    std::string date,
                    std::string description,
                    double impact_score,
                    std::vector<std::string> related_assets = {});

    nlohmann::json to_json() const;
    static RegulatoryEvent from_json(const nlohmann::json& j);

    static bool is_iso8601_date(const std::string& value);
};

// Convenience factories for the four asset classes
Asset make_equity(const std::string& id, const std::string& symbol,
                  const std::string& name, const std::string& sector, double price);
Asset make_bond(const std::string& id, const std::string& symbol,
                const std::string& name, const std::string& sector, double price,
                const std::optional<std::string>& issuer_id = std::nullopt);
Asset make_commodity(const std::string& id, const std::string& symbol,
                     const std::string& name, const std::string& sector, double price);
Asset make_currency(const std::string& id, const std::string& symbol,
                    const std::string& name, double price);

} // namespace ag
