#include "model/financial_models.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <regex>
#include <sstream>

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value.has_value()) {
        j[key] = value.value();
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::string require_string(const nlohmann::json& j, const char* key, const std::string& what) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ag::ConstructionError(what + " record is missing string field '" + key + "'");
    }
    return it->get<std::string>();
}

}  // namespace

namespace ag {

// ==========================================
// Enumerations
// ==========================================

std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::EQUITY: return "equity";
        case AssetClass::FIXED_INCOME: return "fixed_income";
        case AssetClass::COMMODITY: return "commodity";
        case AssetClass::CURRENCY: return "currency";
    }
    return "equity";
}

AssetClass asset_class_from_string(const std::string& value) {
    if (value == "equity") return AssetClass::EQUITY;
    if (value == "fixed_income") return AssetClass::FIXED_INCOME;
    if (value == "commodity") return AssetClass::COMMODITY;
    if (value == "currency") return AssetClass::CURRENCY;
    throw ConstructionError("unknown asset class: " + value);
}

std::string regulatory_activity_to_string(RegulatoryActivity activity) {
    switch (activity) {
        case RegulatoryActivity::EARNINGS_REPORT: return "earnings_report";
        case RegulatoryActivity::SEC_FILING: return "sec_filing";
        case RegulatoryActivity::DIVIDEND_ANNOUNCEMENT: return "dividend_announcement";
        case RegulatoryActivity::MERGER: return "merger";
    }
    return "earnings_report";
}

RegulatoryActivity regulatory_activity_from_string(const std::string& value) {
    if (value == "earnings_report") return RegulatoryActivity::EARNINGS_REPORT;
    if (value == "sec_filing") return RegulatoryActivity::SEC_FILING;
    if (value == "dividend_announcement") return RegulatoryActivity::DIVIDEND_ANNOUNCEMENT;
    if (value == "merger") return RegulatoryActivity::MERGER;
    throw ConstructionError("unknown regulatory event type: " + value);
}

// ==========================================
// Asset Implementation
// ==========================================

Asset::Asset(std::string id_,
             std::string symbol_,
             std::string name_,
             AssetClass asset_class_,
             std::string sector_,
             double price_)
    : id(std::move(id_)),
      symbol(std::move(symbol_)),
      name(std::move(name_)),
      asset_class(asset_class_),
      sector(std::move(sector_)),
      price(price_) {
    if (id.empty()) {
        throw ConstructionError("asset id must be a non-empty string");
    }
    if (symbol.empty()) {
        throw ConstructionError("symbol must be a non-empty string for asset '" + id + "'");
    }
    if (name.empty()) {
        throw ConstructionError("name must be a non-empty string for asset '" + id + "'");
    }
    if (!std::isfinite(price) || price <= 0.0) {
        std::ostringstream ss;
        ss << "price must be a positive number for asset '" << id << "', got " << price;
        throw ConstructionError(ss.str());
    }
    if (sector.empty()) {
        sector = UNKNOWN_SECTOR;
    }
}

std::string Asset::type_name() const {
    switch (asset_class) {
        case AssetClass::EQUITY: return "Equity";
        case AssetClass::FIXED_INCOME: return "Bond";
        case AssetClass::COMMODITY: return "Commodity";
        case AssetClass::CURRENCY: return "Currency";
    }
    return "Asset";
}

nlohmann::json Asset::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["symbol"] = symbol;
    j["name"] = name;
    j["asset_class"] = asset_class_to_string(asset_class);
    j["sector"] = sector;
    j["price"] = price;
    put_optional(j, "market_cap", market_cap);
    j["currency"] = currency;

    switch (asset_class) {
        case AssetClass::EQUITY:
            put_optional(j, "pe_ratio", pe_ratio);
            put_optional(j, "dividend_yield", dividend_yield);
            put_optional(j, "earnings_per_share", earnings_per_share);
            put_optional(j, "book_value", book_value);
            break;
        case AssetClass::FIXED_INCOME:
            put_optional(j, "yield_to_maturity", yield_to_maturity);
            put_optional(j, "coupon_rate", coupon_rate);
            put_optional(j, "maturity_date", maturity_date);
            put_optional(j, "credit_rating", credit_rating);
            put_optional(j, "issuer_id", issuer_id);
            break;
        case AssetClass::COMMODITY:
            put_optional(j, "contract_size", contract_size);
            put_optional(j, "delivery_date", delivery_date);
            put_optional(j, "volatility", volatility);
            break;
        case AssetClass::CURRENCY:
            put_optional(j, "exchange_rate", exchange_rate);
            put_optional(j, "country", country);
            put_optional(j, "central_bank_rate", central_bank_rate);
            break;
    }

    j["__type__"] = type_name();
    return j;
}

Asset Asset::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConstructionError("asset record must be a JSON object");
    }

    AssetClass asset_class = AssetClass::EQUITY;
    if (j.contains("asset_class") && j["asset_class"].is_string()) {
        asset_class = asset_class_from_string(j["asset_class"].get<std::string>());
    } else {
        std::string type_tag = j.value("__type__", "Equity");
        if (type_tag == "Bond") asset_class = AssetClass::FIXED_INCOME;
        else if (type_tag == "Commodity") asset_class = AssetClass::COMMODITY;
        else if (type_tag == "Currency") asset_class = AssetClass::CURRENCY;
    }

    auto price_it = j.find("price");
    if (price_it == j.end() || !price_it->is_number()) {
        throw ConstructionError("asset record is missing numeric field 'price'");
    }

    std::string sector = UNKNOWN_SECTOR;
    if (j.contains("sector") && j["sector"].is_string()) {
        sector = j["sector"].get<std::string>();
    }

    try {
        Asset asset(require_string(j, "id", "asset"),
                    require_string(j, "symbol", "asset"),
                    require_string(j, "name", "asset"),
                    asset_class,
                    sector,
                    price_it->get<double>());

        asset.market_cap = get_optional<double>(j, "market_cap");
        if (j.contains("currency") && j["currency"].is_string()) {
            asset.currency = j["currency"].get<std::string>();
        }

        asset.pe_ratio = get_optional<double>(j, "pe_ratio");
        asset.dividend_yield = get_optional<double>(j, "dividend_yield");
        asset.earnings_per_share = get_optional<double>(j, "earnings_per_share");
        asset.book_value = get_optional<double>(j, "book_value");

        asset.yield_to_maturity = get_optional<double>(j, "yield_to_maturity");
        asset.coupon_rate = get_optional<double>(j, "coupon_rate");
        asset.maturity_date = get_optional<std::string>(j, "maturity_date");
        asset.credit_rating = get_optional<std::string>(j, "credit_rating");
        asset.issuer_id = get_optional<std::string>(j, "issuer_id");

        asset.contract_size = get_optional<double>(j, "contract_size");
        asset.delivery_date = get_optional<std::string>(j, "delivery_date");
        asset.volatility = get_optional<double>(j, "volatility");

        asset.exchange_rate = get_optional<double>(j, "exchange_rate");
        asset.country = get_optional<std::string>(j, "country");
        asset.central_bank_rate = get_optional<double>(j, "central_bank_rate");

        return asset;
    } catch (const nlohmann::json::exception& e) {
        throw ConstructionError(std::string("asset record has a mistyped field: ") + e.what());
    }
}

// ==========================================
// RegulatoryEvent Implementation
// ==========================================

RegulatoryEvent::RegulatoryEvent(std::string id_,
                                 std::string asset_id_,
                                 RegulatoryActivity event_type_,
                                 std::string date_,
                                 std::string description_,
                                 double impact_score_,
                                 std::vector<std::string> related_assets_)
    : id(std::move(id_)),
      asset_id(std::move(asset_id_)),
      event_type(event_type_),
      date(std::move(date_)),
      description(std::move(description_)),
      impact_score(impact_score_),
      related_assets(std::move(related_assets_)) {
    if (id.empty()) {
        throw ConstructionError("event id must be a non-empty string");
    }
    if (asset_id.empty()) {
        throw ConstructionError("asset_id must be a non-empty string for event '" + id + "'");
    }
    if (!std::isfinite(impact_score) || impact_score < -1.0 || impact_score > 1.0) {
        std::ostringstream ss;
        ss << "impact_score must be between -1.0 and 1.0 for event '" << id
           << "', got " << impact_score;
        throw ConstructionError(ss.str());
    }
    if (!is_iso8601_date(date)) {
        throw ConstructionError("date must be in ISO 8601 format for event '" + id +
                                "', got '" + date + "'");
    }
}

bool RegulatoryEvent::is_iso8601_date(const std::string& value) {
    // YYYY-MM-DD with an optional time part
    static const std::regex pattern(
        R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])(T\d{2}:\d{2}(:\d{2}(\.\d+)?)?(Z|[+-]\d{2}:\d{2})?)?$)");
    return std::regex_match(value, pattern);
}

nlohmann::json RegulatoryEvent::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["asset_id"] = asset_id;
    j["event_type"] = regulatory_activity_to_string(event_type);
    j["date"] = date;
    j["description"] = description;
    j["impact_score"] = impact_score;
    j["related_assets"] = related_assets;
    j["__type__"] = "RegulatoryEvent";
    return j;
}

RegulatoryEvent RegulatoryEvent::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConstructionError("regulatory event record must be a JSON object");
    }
    auto score_it = j.find("impact_score");
    if (score_it == j.end() || !score_it->is_number()) {
        throw ConstructionError("regulatory event record is missing numeric field 'impact_score'");
    }

    try {
        std::vector<std::string> related;
        if (j.contains("related_assets") && !j["related_assets"].is_null()) {
            related = j["related_assets"].get<std::vector<std::string>>();
        }

        return RegulatoryEvent(
            require_string(j, "id", "regulatory event"),
            require_string(j, "asset_id", "regulatory event"),
            regulatory_activity_from_string(require_string(j, "event_type", "regulatory event")),
            require_string(j, "date", "regulatory event"),
            j.value("description", ""),
            score_it->get<double>(),
            std::move(related));
    } catch (const nlohmann::json::exception& e) {
        throw ConstructionError(std::string("regulatory event record has a mistyped field: ") + e.what());
    }
}

// ==========================================
// Factories
// ==========================================

Asset make_equity(const std::string& id, const std::string& symbol,
                  const std::string& name, const std::string& sector, double price) {
    return Asset(id, symbol, name, AssetClass::EQUITY, sector, price);
}

Asset make_bond(const std::string& id, const std::string& symbol,
                const std::string& name, const std::string& sector, double price,
                const std::optional<std::string>& issuer_id) {
    Asset bond(id, symbol, name, AssetClass::FIXED_INCOME, sector, price);
    bond.issuer_id = issuer_id;
    return bond;
}

Asset make_commodity(const std::string& id, const std::string& symbol,
                     const std::string& name, const std::string& sector, double price) {
    return Asset(id, symbol, name, AssetClass::COMMODITY, sector, price);
}

Asset make_currency(const std::string& id, const std::string& symbol,
                    const std::string& name, double price) {
    Asset currency(id, symbol, name, AssetClass::CURRENCY, "Forex", price);
    currency.exchange_rate = price;
    return currency;
}

} // namespace ag
