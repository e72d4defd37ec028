#include "data/sample_data.hpp"

namespace ag {

std::vector<Asset> sample_assets() {
    std::vector<Asset> assets;

    // Equities
    auto aapl = make_equity("AAPL", "AAPL", "Apple Inc.", "Technology", 175.50);
    aapl.market_cap = 2.7e12;
    aapl.pe_ratio = 28.5;
    aapl.dividend_yield = 0.005;
    aapl.earnings_per_share = 6.16;
    assets.push_back(aapl);

    auto msft = make_equity("MSFT", "MSFT", "Microsoft Corporation", "Technology", 378.85);
    msft.market_cap = 2.8e12;
    msft.pe_ratio = 35.2;
    msft.dividend_yield = 0.008;
    msft.earnings_per_share = 10.76;
    assets.push_back(msft);

    auto xom = make_equity("XOM", "XOM", "Exxon Mobil Corporation", "Energy", 104.20);
    xom.market_cap = 4.2e11;
    xom.pe_ratio = 11.8;
    xom.dividend_yield = 0.035;
    xom.earnings_per_share = 8.83;
    assets.push_back(xom);

    auto jpm = make_equity("JPM", "JPM", "JPMorgan Chase & Co.", "Financial Services", 172.30);
    jpm.market_cap = 5.0e11;
    jpm.pe_ratio = 10.5;
    jpm.dividend_yield = 0.025;
    jpm.earnings_per_share = 16.41;
    assets.push_back(jpm);

    // Bonds
    auto tlt = make_bond("TLT", "TLT", "iShares 20+ Year Treasury Bond ETF", "Government", 92.40);
    tlt.yield_to_maturity = 0.03;
    tlt.coupon_rate = 0.025;
    tlt.maturity_date = "2035-01-01";
    tlt.credit_rating = "AAA";
    assets.push_back(tlt);

    auto lqd = make_bond("LQD", "LQD", "iShares iBoxx $ Investment Grade Corporate Bond ETF",
                         "Corporate", 108.75);
    lqd.yield_to_maturity = 0.03;
    lqd.coupon_rate = 0.025;
    lqd.maturity_date = "2035-01-01";
    assets.push_back(lqd);

    auto aapl_bond = make_bond("AAPL_BOND", "AAPL4.65", "Apple Inc. 4.65% 2046 Notes",
                               "Corporate", 95.80, std::string("AAPL"));
    aapl_bond.yield_to_maturity = 0.049;
    aapl_bond.coupon_rate = 0.0465;
    aapl_bond.maturity_date = "2046-02-23";
    aapl_bond.credit_rating = "AA+";
    assets.push_back(aapl_bond);

    // Commodities
    auto gold = make_commodity("GC_FUTURE", "GC=F", "Gold Futures", "Metals", 2050.00);
    gold.contract_size = 100.0;
    gold.delivery_date = "2025-03-31";
    gold.volatility = 0.20;
    assets.push_back(gold);

    auto crude = make_commodity("CL_FUTURE", "CL=F", "Crude Oil Futures", "Energy", 78.50);
    crude.contract_size = 1000.0;
    crude.delivery_date = "2025-03-31";
    crude.volatility = 0.35;
    assets.push_back(crude);

    // Currencies
    auto eur = make_currency("EURUSD", "EUR", "Euro", 1.085);
    eur.country = "EU";
    eur.central_bank_rate = 0.02;
    assets.push_back(eur);

    auto gbp = make_currency("GBPUSD", "GBP", "British Pound", 1.265);
    gbp.country = "UK";
    gbp.central_bank_rate = 0.02;
    assets.push_back(gbp);

    auto jpy = make_currency("JPYUSD", "JPY", "Japanese Yen", 0.0067);
    jpy.country = "Japan";
    jpy.central_bank_rate = 0.02;
    assets.push_back(jpy);

    return assets;
}

std::vector<RegulatoryEvent> sample_regulatory_events() {
    return {
        RegulatoryEvent("AAPL_Q4_2024_REAL", "AAPL", RegulatoryActivity::EARNINGS_REPORT,
                        "2024-11-01", "Q4 2024 Earnings Report - Record iPhone sales",
                        0.12, {"TLT", "MSFT"}),
        RegulatoryEvent("MSFT_DIV_2024_REAL", "MSFT", RegulatoryActivity::DIVIDEND_ANNOUNCEMENT,
                        "2024-09-15", "Quarterly dividend increase - Cloud growth continues",
                        0.08, {"AAPL", "LQD"}),
        RegulatoryEvent("XOM_SEC_2024_REAL", "XOM", RegulatoryActivity::SEC_FILING,
                        "2024-10-01", "10-K Filing - Increased oil reserves and sustainability initiatives",
                        0.05, {"CL_FUTURE"})
    };
}

AssetGraph create_sample_database() {
    AssetGraph graph;
    for (const auto& asset : sample_assets()) {
        graph.add_asset(asset);
    }
    for (const auto& event : sample_regulatory_events()) {
        graph.add_regulatory_event(event);
    }
    graph.build_relationships();
    return graph;
}

} // namespace ag
